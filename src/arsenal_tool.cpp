#include "arsenal_tool.h"

namespace arsenal {

    tool_builder::tool_builder(const std::string& name)
        : name_(name) {}

    tool_builder& tool_builder::with_description(const std::string& description) {
        description_ = description;
        return *this;
    }

    tool_builder& tool_builder::add_param(const std::string& name, json param, bool required) {
        if (name.empty()) {
            throw std::invalid_argument("Parameter name must not be empty for tool " + name_);
        }

        properties_[name] = std::move(param);

        if (required) {
            required_params_.push_back(name);
        }
        return *this;
    }

    tool_builder& tool_builder::with_string_param(const std::string& name,
            const std::string& description,
            bool required) {
        return add_param(name, {{"type", "string"}, {"description", description}}, required);
    }

    tool_builder& tool_builder::with_number_param(const std::string& name,
            const std::string& description,
            bool required) {
        return add_param(name, {{"type", "number"}, {"description", description}}, required);
    }

    tool_builder& tool_builder::with_boolean_param(const std::string& name,
            const std::string& description,
            bool required) {
        return add_param(name, {{"type", "boolean"}, {"description", description}}, required);
    }

    tool_builder& tool_builder::with_array_param(const std::string& name,
            const std::string& description,
            const std::string& item_type,
            bool required) {
        json param = {
            {"type", "array"},
            {"description", description},
            {"items", {{"type", item_type}}}
        };
        return add_param(name, std::move(param), required);
    }

    tool tool_builder::build() const {
        tool t;
        t.name = name_;
        t.description = description_;

        // Clients validate arguments against this shape, so "required" is always emitted
        t.input_schema = {
            {"type", "object"},
            {"properties", properties_},
            {"required", required_params_}
        };

        return t;
    }

} // namespace arsenal
