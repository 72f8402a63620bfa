#ifndef ARSENAL_TOOL_H
#define ARSENAL_TOOL_H

#include "arsenal_message.h"

#include <functional>
#include <future>
#include <string>
#include <tuple>
#include <vector>

namespace arsenal {

    // Tool descriptor as advertised by tools/list
    struct tool {
        std::string name;
        std::string description;
        json input_schema;

        json to_json() const {
            return {
                {"name", name},
                {"description", description},
                {"inputSchema", input_schema}
            };
        }
    };

    // Outcome of one tool invocation: either text or a failure reason
    class tool_result {
        public:
            static tool_result success(std::string text) {
                return tool_result(true, std::move(text));
            }

            static tool_result failure(std::string reason) {
                return tool_result(false, std::move(reason));
            }

            bool ok() const { return ok_; }

            // Rendered text on success, failure reason otherwise
            const std::string& text() const { return text_; }

        private:
            tool_result(bool ok, std::string text) : ok_(ok), text_(std::move(text)) {}

            bool ok_;
            std::string text_;
    };

    using tool_handler = std::function<tool_result(const json& arguments)>;
    using async_tool_handler = std::function<std::future<tool_result>(const json& arguments)>;

    class tool_builder {
        public:
            explicit tool_builder(const std::string& name);

            tool_builder& with_description(const std::string& description);

            tool_builder& with_string_param(const std::string& name,
                    const std::string& description,
                    bool required = true);

            tool_builder& with_number_param(const std::string& name,
                    const std::string& description,
                    bool required = true);

            tool_builder& with_boolean_param(const std::string& name,
                    const std::string& description,
                    bool required = true);

            tool_builder& with_array_param(const std::string& name,
                    const std::string& description,
                    const std::string& item_type,
                    bool required = true);

            tool build() const;

        private:
            std::string name_;
            std::string description_;
            json properties_ = json::object();
            std::vector<std::string> required_params_;

            tool_builder& add_param(const std::string& name, json param, bool required);
    };

    // (name, description, type, required)
    inline tool create_tool(
            const std::string& name,
            const std::string& description,
            const std::vector<std::tuple<std::string, std::string, std::string, bool>>& parameter_definitions) {
        tool_builder builder(name);
        builder.with_description(description);

        for (const auto& [param_name, param_desc, param_type, required] : parameter_definitions) {
            if (param_type == "string") {
                builder.with_string_param(param_name, param_desc, required);
            } else if (param_type == "number") {
                builder.with_number_param(param_name, param_desc, required);
            } else if (param_type == "boolean") {
                builder.with_boolean_param(param_name, param_desc, required);
            } else {
                throw std::invalid_argument("Unsupported parameter type '" + param_type + "' for " + param_name);
            }
        }
        return builder.build();
    }

} // namespace arsenal

#endif // ARSENAL_TOOL_H
