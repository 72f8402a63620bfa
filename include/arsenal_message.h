#ifndef ARSENAL_MESSAGE_H
#define ARSENAL_MESSAGE_H

#include <nlohmann/json.hpp>

#include <string>
#include <stdexcept>

#define ARSENAL_PROTOCOL_VERSION "2024-11-05"
#define ARSENAL_JSONRPC_VERSION "2.0"

namespace arsenal {

    // ordered_json keeps emitted keys in insertion order
    using json = nlohmann::ordered_json;

    // JSON-RPC 2.0 error codes
    enum class error_code {
        parse_error = -32700,
        invalid_request = -32600,
        method_not_found = -32601,
        invalid_params = -32602,
        internal_error = -32603
    };

    class arsenal_exception : public std::runtime_error {
        public:
            arsenal_exception(error_code code, const std::string& message)
                : std::runtime_error(message), code_(code) {}

            error_code code() const { return code_; }

        private:
            error_code code_;
    };

    class duplicate_tool_error : public arsenal_exception {
        public:
            explicit duplicate_tool_error(const std::string& name)
                : arsenal_exception(error_code::invalid_request, "Duplicate tool: " + name), name_(name) {}

            const std::string& tool_name() const { return name_; }

        private:
            std::string name_;
    };

    class tool_not_found_error : public arsenal_exception {
        public:
            explicit tool_not_found_error(const std::string& name)
                : arsenal_exception(error_code::method_not_found, "Tool not found: " + name), name_(name) {}

            const std::string& tool_name() const { return name_; }

        private:
            std::string name_;
    };

    struct request {
        std::string jsonrpc = ARSENAL_JSONRPC_VERSION;
        json id;
        std::string method;
        json params = json::object();

        // A request without an id (or with a null id) expects no response
        bool is_notification() const {
            return id.is_null();
        }

        static request create(const json& id, const std::string& method, const json& params = json::object()) {
            request req;
            req.id = id;
            req.method = method;
            req.params = params;
            return req;
        }

        static request create_notification(const std::string& method, const json& params = json::object()) {
            request req;
            req.method = method;
            req.params = params;
            return req;
        }

        // Throws arsenal_exception(internal_error) when the payload is not a request
        static request from_json(const json& j);

        json to_json() const {
            json j = {
                {"jsonrpc", jsonrpc},
                {"method", method}
            };
            if (!id.is_null()) {
                j["id"] = id;
            }
            if (!params.empty()) {
                j["params"] = params;
            }
            return j;
        }
    };

    struct response {
        std::string jsonrpc = ARSENAL_JSONRPC_VERSION;
        json id;
        json result;
        json error;

        bool is_error() const {
            return !error.is_null();
        }

        static response create_success(const json& id, const json& result = json::object()) {
            response res;
            res.id = id;
            res.result = result;
            return res;
        }

        static response create_error(const json& id, error_code code, const std::string& message, const json& data = json()) {
            response res;
            res.id = id;
            res.error = {
                {"code", static_cast<int>(code)},
                {"message", message}
            };
            if (!data.is_null()) {
                res.error["data"] = data;
            }
            return res;
        }

        json to_json() const {
            json j = {
                {"jsonrpc", jsonrpc},
                {"id", id}
            };
            if (is_error()) {
                j["error"] = error;
            } else {
                j["result"] = result;
            }
            return j;
        }
    };

} // namespace arsenal

#endif // ARSENAL_MESSAGE_H
