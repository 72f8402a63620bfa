#ifndef ARSENAL_SERVER_H
#define ARSENAL_SERVER_H

#include "arsenal_dispatcher.h"
#include "arsenal_health.h"
#include "arsenal_message.h"
#include "arsenal_registry.h"
#include "arsenal_request_handler.h"
#include "arsenal_session.h"
#include "arsenal_executor.h"
#include "arsenal_tracer.h"

#include "httplib.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace arsenal {

    class server {
        public:
            struct configuration {
                std::string host = "0.0.0.0";
                // 0 binds an ephemeral port, see port()
                int port = 7860;

                std::string name = "arsenal-mcp-server";
                std::string version = "3.0.0";
                std::string description = "Kali Linux tool arsenal catalog over MCP";
                std::string platform = "Arsenal MCP Server (SSE)";

                std::string sse_endpoint = "/mcp/sse";
                std::string health_endpoint = "/health";

                std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(30);
                std::chrono::milliseconds session_timeout = std::chrono::minutes(60);
                std::chrono::milliseconds maintenance_interval = std::chrono::seconds(1);
                // How long one SSE write loop waits for events before re-checking the socket
                std::chrono::milliseconds stream_poll_interval = std::chrono::seconds(1);

                // Serves session-routed POSTs
                size_t threadpool_size = std::thread::hardware_concurrency();
                // Runs tool handlers
                size_t tool_threads = std::thread::hardware_concurrency();
                // One HTTP worker is held by every open event stream
                size_t http_threads = 64;
                // Open streams beyond this get 503. Must stay below http_threads
                // so that health checks and single-shot POSTs always find a worker.
                size_t max_streams = 48;

                // Catalog facts reported by the health endpoint
                size_t arsenal_tools = 0;
                bool bleeding_edge = false;
            };

            server(const configuration& conf,
                std::shared_ptr<const tool_registry> registry,
                json capabilities,
                std::shared_ptr<tracer> tracer = nullptr);

            ~server();

            server(const server&) = delete;
            server& operator=(const server&) = delete;

            // Returns false if the address could not be bound. With blocking
            // set, returns only after stop().
            bool start(bool blocking = true);

            void stop();

            bool is_running() const;

            // Port actually bound, valid after start()
            int port() const { return bound_port_.load(); }

            size_t session_count() const;

            dispatcher& rpc_dispatcher() { return dispatcher_; }

        private:
            void register_routes();

            void handle_sse(const httplib::Request& req, httplib::Response& res);

            void handle_post(const httplib::Request& req, httplib::Response& res);

            // POST carrying ?session_id=: answered on that session's stream
            void handle_session_post(const std::string& session_id, const httplib::Request& req, httplib::Response& res);

            void handle_health(const httplib::Request& req, httplib::Response& res);

            std::shared_ptr<sse_session> find_session(const std::string& session_id) const;

            void close_session(const std::string& session_id);

            void maintenance_loop();

            void check_inactive_sessions();

            std::string generate_session_id() const;

            static void write_reply(httplib::Response& res, const http_reply& reply);

            configuration conf_;
            std::shared_ptr<const tool_registry> registry_;

            dispatcher dispatcher_;
            request_handler request_handler_;
            health_endpoint health_;

            std::unique_ptr<httplib::Server> http_server_;
            std::unique_ptr<std::thread> server_thread_;
            std::unique_ptr<std::thread> maintenance_thread_;

            std::map<std::string, std::shared_ptr<sse_session>> sessions_;
            mutable std::mutex mutex_;

            std::mutex maintenance_mutex_;
            std::condition_variable maintenance_cv_;

            std::atomic<bool> running_{false};
            std::atomic<int> bound_port_{-1};

            tool_executor request_executor_;
    };

} // namespace arsenal

#endif // ARSENAL_SERVER_H
