#include "arsenal_message.h"

namespace arsenal {

    request request::from_json(const json& j) {
        if (!j.is_object()) {
            throw arsenal_exception(error_code::internal_error, "Request must be a JSON object");
        }

        request req;

        if (j.contains("jsonrpc")) {
            if (!j["jsonrpc"].is_string() || j["jsonrpc"].get<std::string>() != ARSENAL_JSONRPC_VERSION) {
                throw arsenal_exception(error_code::internal_error, "Unsupported jsonrpc version");
            }
        }

        if (!j.contains("method") || !j["method"].is_string()) {
            throw arsenal_exception(error_code::internal_error, "Missing or invalid 'method'");
        }
        req.method = j["method"].get<std::string>();

        if (j.contains("id")) {
            const json& id = j["id"];
            if (!id.is_null() && !id.is_string() && !id.is_number()) {
                throw arsenal_exception(error_code::internal_error, "'id' must be a string or a number");
            }
            req.id = id;
        }

        if (j.contains("params") && !j["params"].is_null()) {
            if (!j["params"].is_object()) {
                throw arsenal_exception(error_code::internal_error, "'params' must be an object");
            }
            req.params = j["params"];
        }

        return req;
    }

} // namespace arsenal
