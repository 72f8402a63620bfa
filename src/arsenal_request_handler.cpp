#include "arsenal_request_handler.h"
#include "arsenal_logger.h"

namespace arsenal {

    request_handler::request_handler(dispatcher& rpc_dispatcher)
        : dispatcher_(rpc_dispatcher) {}

    request request_handler::parse(const std::string& body, json& id) {
        json req_json;
        try {
            req_json = json::parse(body);
        } catch (const json::exception& e) {
            throw arsenal_exception(error_code::internal_error, std::string("Invalid JSON: ") + e.what());
        }

        if (req_json.is_object() && req_json.contains("id")) {
            const json& raw_id = req_json["id"];
            if (raw_id.is_string() || raw_id.is_number()) {
                id = raw_id;
            }
        }

        return request::from_json(req_json);
    }

    http_reply request_handler::protocol_error(const json& id, const std::string& description) {
        http_reply reply;
        reply.status = 500;
        reply.body = response::create_error(id, error_code::internal_error, "Internal error: " + description).to_json();
        return reply;
    }

    http_reply request_handler::handle(const std::string& body) {
        json id;
        request req;
        try {
            req = parse(body, id);
        } catch (const arsenal_exception& e) {
            LOG_ERROR("Failed to parse request: ", e.what());
            return protocol_error(id, e.what());
        }

        LOG_DEBUG("Request: method=", req.method);
        response res = dispatcher_.handle(req);

        http_reply reply;
        if (req.is_notification()) {
            reply.status = 202;
            return reply;
        }

        reply.body = res.to_json();
        return reply;
    }

} // namespace arsenal
