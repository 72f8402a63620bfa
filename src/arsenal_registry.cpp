#include "arsenal_registry.h"
#include "arsenal_logger.h"

namespace arsenal {

    void tool_registry::register_tool(const tool& descriptor, tool_handler handler) {
        if (!handler) {
            throw std::invalid_argument("Tool handler must not be empty: " + descriptor.name);
        }

        registered_tool entry;
        entry.descriptor = descriptor;
        entry.handler = std::move(handler);
        add(std::move(entry));
    }

    void tool_registry::register_tool(const tool& descriptor, async_tool_handler handler) {
        if (!handler) {
            throw std::invalid_argument("Tool handler must not be empty: " + descriptor.name);
        }

        registered_tool entry;
        entry.descriptor = descriptor;
        entry.async_handler = std::move(handler);
        add(std::move(entry));
    }

    void tool_registry::add(registered_tool entry) {
        const std::string& name = entry.descriptor.name;
        if (name.empty()) {
            throw std::invalid_argument("Tool name must not be empty");
        }
        if (index_.count(name) > 0) {
            throw duplicate_tool_error(name);
        }

        index_.emplace(name, tools_.size());
        LOG_DEBUG("Registered tool: ", name);
        tools_.push_back(std::move(entry));
    }

    std::vector<tool> tool_registry::list() const {
        std::vector<tool> result;
        result.reserve(tools_.size());
        for (const auto& entry : tools_) {
            result.push_back(entry.descriptor);
        }
        return result;
    }

    const registered_tool& tool_registry::get(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) {
            throw tool_not_found_error(name);
        }
        return tools_[it->second];
    }

    bool tool_registry::contains(const std::string& name) const {
        return index_.count(name) > 0;
    }

} // namespace arsenal
