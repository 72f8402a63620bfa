#ifndef ARSENAL_REQUEST_HANDLER_H
#define ARSENAL_REQUEST_HANDLER_H

#include "arsenal_dispatcher.h"
#include "arsenal_message.h"

#include <optional>
#include <string>

namespace arsenal {

    struct http_reply {
        int status = 200;
        std::optional<json> body;
    };

    // One POSTed JSON-RPC call in, one reply out. Payloads that cannot be
    // parsed as a request get -32603 with status 500; everything else is
    // answered at the RPC layer with status 200 (202 for notifications).
    class request_handler {
        public:
            explicit request_handler(dispatcher& rpc_dispatcher);

            http_reply handle(const std::string& body);

            // Throws arsenal_exception(internal_error). id receives the request
            // id whenever the body was JSON carrying a usable one.
            static request parse(const std::string& body, json& id);

            static http_reply protocol_error(const json& id, const std::string& description);

        private:
            dispatcher& dispatcher_;
    };

} // namespace arsenal

#endif // ARSENAL_REQUEST_HANDLER_H
