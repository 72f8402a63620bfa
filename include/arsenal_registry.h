#ifndef ARSENAL_REGISTRY_H
#define ARSENAL_REGISTRY_H

#include "arsenal_tool.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace arsenal {

    // A descriptor and the handler that implements it. Exactly one of
    // handler / async_handler is set.
    struct registered_tool {
        tool descriptor;
        tool_handler handler;
        async_tool_handler async_handler;

        bool is_async() const {
            return static_cast<bool>(async_handler);
        }
    };

    // Name-keyed tool table. Filled once at startup, then shared as
    // std::shared_ptr<const tool_registry>; const access needs no locking.
    class tool_registry {
        public:
            tool_registry() = default;

            // Throws duplicate_tool_error if the name is already registered
            void register_tool(const tool& descriptor, tool_handler handler);

            void register_tool(const tool& descriptor, async_tool_handler handler);

            // Registration order
            std::vector<tool> list() const;

            // Throws tool_not_found_error
            const registered_tool& get(const std::string& name) const;

            bool contains(const std::string& name) const;

            size_t size() const {
                return tools_.size();
            }

        private:
            void add(registered_tool entry);

            std::vector<registered_tool> tools_;
            std::unordered_map<std::string, size_t> index_;
    };

} // namespace arsenal

#endif // ARSENAL_REGISTRY_H
