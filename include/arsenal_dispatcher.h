#ifndef ARSENAL_DISPATCHER_H
#define ARSENAL_DISPATCHER_H

#include "arsenal_message.h"
#include "arsenal_registry.h"
#include "arsenal_executor.h"
#include "arsenal_tracer.h"

#include <memory>
#include <string>
#include <variant>

namespace arsenal {

    struct server_info {
        std::string name;
        std::string version;
        std::string description;

        json to_json() const {
            json j = {
                {"name", name},
                {"version", version}
            };
            if (!description.empty()) {
                j["description"] = description;
            }
            return j;
        }
    };

    // Decoded form of each supported method
    namespace rpc {

        struct initialize_call {
            std::string protocol_version;
            json client_info;
        };

        struct list_tools_call {};

        struct call_tool_call {
            std::string name;
            json arguments = json::object();
            // Set when the arguments could not be read as an object; the call
            // then fails as a tool execution error once the tool is resolved
            std::string arguments_error;
        };

        struct ping_call {};

        struct initialized_notification {};

        struct unknown_method {
            std::string method;
        };

        using call = std::variant<
            initialize_call,
            list_tools_call,
            call_tool_call,
            ping_call,
            initialized_notification,
            unknown_method>;

        call decode(const request& req);

    } // namespace rpc

    class dispatcher {
        public:
            dispatcher(std::shared_ptr<const tool_registry> registry,
                server_info info,
                json capabilities,
                std::shared_ptr<tracer> tracer = nullptr,
                size_t tool_threads = std::thread::hardware_concurrency());

            dispatcher(const dispatcher&) = delete;
            dispatcher& operator=(const dispatcher&) = delete;

            // Never throws for well-formed requests; every failure becomes an error response
            response handle(const request& req);

            // {protocolVersion, capabilities, serverInfo}
            json initialize_result() const;

            const json& capabilities() const { return capabilities_; }

            const server_info& info() const { return info_; }

            const tool_registry& registry() const { return *registry_; }

        private:
            json route(const rpc::initialize_call& call);
            json route(const rpc::list_tools_call& call);
            json route(const rpc::call_tool_call& call);
            json route(const rpc::ping_call& call);
            json route(const rpc::initialized_notification& call);
            json route(const rpc::unknown_method& call);

            // Runs the handler and folds every failure into tool_result::failure
            tool_result invoke(const registered_tool& entry, const json& arguments);

            std::shared_ptr<const tool_registry> registry_;
            const server_info info_;
            const json capabilities_;
            std::shared_ptr<tracer> tracer_;

            tool_executor tool_executor_;
    };

} // namespace arsenal

#endif // ARSENAL_DISPATCHER_H
