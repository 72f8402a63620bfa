#include "arsenal_dispatcher.h"
#include "arsenal_logger.h"

#include <functional>
#include <unordered_map>

namespace arsenal {

    namespace rpc {

        namespace {

            using decoder = std::function<call(const json& params)>;

            call decode_initialize(const json& params) {
                initialize_call decoded;
                if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
                    decoded.protocol_version = params["protocolVersion"].get<std::string>();
                }
                if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
                    decoded.client_info = params["clientInfo"];
                }
                return decoded;
            }

            call decode_call_tool(const json& params) {
                call_tool_call decoded;
                // A missing name is looked up as "" and answered as an unknown tool
                if (params.contains("name") && params["name"].is_string()) {
                    decoded.name = params["name"].get<std::string>();
                }

                json arguments = params.contains("arguments") ? params["arguments"] : json();
                if (arguments.is_null()) {
                    arguments = json::object();
                } else if (arguments.is_string()) {
                    // Some clients send the arguments pre-serialized
                    try {
                        arguments = json::parse(arguments.get<std::string>());
                    } catch (const json::exception& e) {
                        decoded.arguments_error = "Invalid JSON arguments: " + std::string(e.what());
                        return decoded;
                    }
                }

                if (!arguments.is_object()) {
                    decoded.arguments_error = "'arguments' must be an object";
                    return decoded;
                }

                decoded.arguments = std::move(arguments);
                return decoded;
            }

            const std::unordered_map<std::string, decoder>& decoders() {
                static const std::unordered_map<std::string, decoder> table = {
                    {"initialize", decode_initialize},
                    {"tools/list", [](const json&) -> call { return list_tools_call{}; }},
                    {"tools/call", decode_call_tool},
                    {"ping", [](const json&) -> call { return ping_call{}; }},
                    {"notifications/initialized", [](const json&) -> call { return initialized_notification{}; }}
                };
                return table;
            }

        } // namespace

        call decode(const request& req) {
            auto it = decoders().find(req.method);
            if (it == decoders().end()) {
                return unknown_method{req.method};
            }
            return it->second(req.params);
        }

    } // namespace rpc

    dispatcher::dispatcher(std::shared_ptr<const tool_registry> registry,
            server_info info,
            json capabilities,
            std::shared_ptr<tracer> tracer,
            size_t tool_threads)
        : registry_(std::move(registry)),
          info_(std::move(info)),
          capabilities_(std::move(capabilities)),
          tracer_(std::move(tracer)),
          tool_executor_("tools", tool_threads) {
        if (!registry_) {
            throw std::invalid_argument("dispatcher requires a tool registry");
        }
    }

    response dispatcher::handle(const request& req) {
        try {
            LOG_DEBUG("Dispatching method: ", req.method);
            rpc::call decoded = rpc::decode(req);
            json result = std::visit([this](const auto& call) { return route(call); }, decoded);
            return response::create_success(req.id, result);
        } catch (const arsenal_exception& e) {
            LOG_WARNING("Request failed: ", req.method, ": ", e.what());
            return response::create_error(req.id, e.code(), e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Exception while processing ", req.method, ": ", e.what());
            return response::create_error(req.id, error_code::internal_error, "Internal error: " + std::string(e.what()));
        }
    }

    json dispatcher::initialize_result() const {
        return {
            {"protocolVersion", ARSENAL_PROTOCOL_VERSION},
            {"capabilities", capabilities_},
            {"serverInfo", info_.to_json()}
        };
    }

    json dispatcher::route(const rpc::initialize_call& call) {
        std::string client_name = "UnknownClient";
        std::string client_version = "UnknownVersion";
        if (call.client_info.contains("name") && call.client_info["name"].is_string()) {
            client_name = call.client_info["name"].get<std::string>();
        }
        if (call.client_info.contains("version") && call.client_info["version"].is_string()) {
            client_version = call.client_info["version"].get<std::string>();
        }

        if (!call.protocol_version.empty() && call.protocol_version != ARSENAL_PROTOCOL_VERSION) {
            LOG_INFO("Client requested protocol ", call.protocol_version, ", answering with ", ARSENAL_PROTOCOL_VERSION);
        }
        LOG_INFO("Client initialized: ", client_name, " ", client_version);

        return initialize_result();
    }

    json dispatcher::route(const rpc::list_tools_call&) {
        json tools = json::array();
        for (const auto& t : registry_->list()) {
            tools.push_back(t.to_json());
        }
        return {{"tools", tools}};
    }

    json dispatcher::route(const rpc::call_tool_call& call) {
        // Throws tool_not_found_error, answered as -32601
        const registered_tool& entry = registry_->get(call.name);

        LOG_INFO("Calling tool: ", call.name);
        tool_result result = call.arguments_error.empty()
            ? invoke(entry, call.arguments)
            : tool_result::failure(call.arguments_error);

        if (!result.ok()) {
            LOG_WARNING("Tool ", call.name, " failed: ", result.text());
            return {
                {"content", json::array({{{"type", "text"}, {"text", "Tool execution failed: " + result.text()}}})},
                {"isError", true}
            };
        }

        return {
            {"content", json::array({{{"type", "text"}, {"text", result.text()}}})},
            {"isError", false}
        };
    }

    json dispatcher::route(const rpc::ping_call&) {
        return json::object();
    }

    json dispatcher::route(const rpc::initialized_notification&) {
        LOG_DEBUG("Client sent notifications/initialized");
        return json::object();
    }

    json dispatcher::route(const rpc::unknown_method& call) {
        throw arsenal_exception(error_code::method_not_found, "Method not found: " + call.method);
    }

    tool_result dispatcher::invoke(const registered_tool& entry, const json& arguments) {
        const std::string& name = entry.descriptor.name;

        std::unique_ptr<scoped_span> span;
        if (tracer_) {
            span = tracer_->span("mcp.tool." + name);
            span->set_attribute("tool.name", name);
            span->set_attribute("tool.arguments_count", arguments.size());
        }

        tool_result result = tool_result::failure("no result");
        try {
            std::future<tool_result> pending = entry.is_async()
                ? entry.async_handler(arguments)
                : tool_executor_.submit(entry.handler, arguments);

            if (!pending.valid()) {
                throw std::runtime_error("handler returned an empty future");
            }
            result = pending.get();
        } catch (const std::exception& e) {
            result = tool_result::failure(e.what());
        }

        if (span) {
            span->set_attribute("tool.success", result.ok());
            if (result.ok()) {
                span->set_attribute("tool.result_length", result.text().size());
            } else {
                span->set_attribute("tool.error", result.text());
                span->record_error(result.text());
            }
        }

        return result;
    }

} // namespace arsenal
