#include "arsenal_server.h"
#include "arsenal_logger.h"

#include <random>
#include <stdexcept>
#include <sstream>
#include <vector>

namespace arsenal {

    server::server(const configuration& conf,
            std::shared_ptr<const tool_registry> registry,
            json capabilities,
            std::shared_ptr<tracer> tracer)
        : conf_(conf),
          registry_(registry),
          dispatcher_(registry, server_info{conf.name, conf.version, conf.description}, std::move(capabilities), std::move(tracer), conf.tool_threads),
          request_handler_(dispatcher_),
          health_(*registry_, health_info{conf.name, conf.version, conf.platform, dispatcher_.capabilities(), conf.arsenal_tools, conf.bleeding_edge}),
          request_executor_("requests", conf.threadpool_size) {
        if (conf_.max_streams == 0 || conf_.max_streams >= conf_.http_threads) {
            throw std::invalid_argument("max_streams must be between 1 and http_threads - 1");
        }
    }

    server::~server() {
        stop();
    }

    bool server::start(bool blocking) {
        if (running_) {
            LOG_WARNING("Server already running on ", conf_.host, ":", bound_port_.load());
            return true;
        }

        http_server_ = std::make_unique<httplib::Server>();

        const size_t http_threads = conf_.http_threads;
        http_server_->new_task_queue = [http_threads] {
            return new httplib::ThreadPool(http_threads);
        };

        register_routes();

        int port = conf_.port;
        if (port == 0) {
            port = http_server_->bind_to_any_port(conf_.host);
        } else if (!http_server_->bind_to_port(conf_.host, port)) {
            port = -1;
        }

        if (port < 0) {
            LOG_ERROR("Failed to bind ", conf_.host, ":", conf_.port);
            return false;
        }

        bound_port_ = port;
        running_ = true;

        maintenance_thread_ = std::make_unique<std::thread>(&server::maintenance_loop, this);

        LOG_INFO("Starting ", conf_.name, " ", conf_.version, " on ", conf_.host, ":", port);
        LOG_INFO("SSE endpoint: ", conf_.sse_endpoint, ", health: ", conf_.health_endpoint,
            ", tools: ", registry_->size());

        if (blocking) {
            if (!http_server_->listen_after_bind()) {
                LOG_ERROR("HTTP listener stopped with an error");
            }
            return true;
        }

        server_thread_ = std::make_unique<std::thread>([this]() {
            if (!http_server_->listen_after_bind()) {
                LOG_ERROR("HTTP listener stopped with an error");
            }
        });
        return true;
    }

    void server::stop() {
        if (!running_.exchange(false)) {
            return;
        }

        LOG_INFO("Stopping server on ", conf_.host, ":", bound_port_.load());

        {
            std::lock_guard<std::mutex> lock(maintenance_mutex_);
        }
        maintenance_cv_.notify_all();
        if (maintenance_thread_ && maintenance_thread_->joinable()) {
            maintenance_thread_->join();
        }

        // Copy sessions out to avoid holding the lock while closing them
        std::vector<std::shared_ptr<sse_session>> sessions_to_close;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, session] : sessions_) {
                sessions_to_close.push_back(session);
            }
            sessions_.clear();
        }

        for (auto& session : sessions_to_close) {
            session->close();
        }

        if (http_server_) {
            http_server_->stop();
        }

        if (server_thread_ && server_thread_->joinable()) {
            server_thread_->join();
        }

        LOG_INFO("Server stopped");
    }

    bool server::is_running() const {
        return running_;
    }

    size_t server::session_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    void server::register_routes() {
        http_server_->set_default_headers({
            {"Access-Control-Allow-Origin", "*"}
        });

        http_server_->Options(conf_.sse_endpoint, [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.status = 204;
        });

        http_server_->Get(conf_.sse_endpoint, [this](const httplib::Request& req, httplib::Response& res) {
            handle_sse(req, res);
        });

        http_server_->Post(conf_.sse_endpoint, [this](const httplib::Request& req, httplib::Response& res) {
            handle_post(req, res);
        });

        http_server_->Get(conf_.health_endpoint, [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
    }

    void server::handle_sse(const httplib::Request& req, httplib::Response& res) {
        const std::string session_id = generate_session_id();

        auto session = std::make_shared<sse_session>(session_id, dispatcher_.initialize_result(), conf_.heartbeat_interval);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sessions_.size() >= conf_.max_streams) {
                LOG_WARNING("Refusing SSE connection from ", req.remote_addr, ": ", sessions_.size(), " streams open");
                res.status = 503;
                res.set_content(R"({"error":"Too many open streams"})", "application/json");
                return;
            }
            sessions_[session_id] = session;
        }
        session->start();

        LOG_INFO("SSE connection from ", req.remote_addr, ", session ", session_id);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");

        const auto poll_interval = conf_.stream_poll_interval;
        res.set_chunked_content_provider("text/event-stream",
            [session, poll_interval](size_t /* offset */, httplib::DataSink& sink) {
                return session->pump([&sink](const std::string& event) {
                    return sink.write(event.data(), event.size());
                }, poll_interval);
            },
            [this, session_id](bool /* success */) {
                close_session(session_id);
            });
    }

    void server::handle_post(const httplib::Request& req, httplib::Response& res) {
        if (req.has_param("session_id")) {
            handle_session_post(req.get_param_value("session_id"), req, res);
            return;
        }

        write_reply(res, request_handler_.handle(req.body));
    }

    void server::handle_session_post(const std::string& session_id, const httplib::Request& req, httplib::Response& res) {
        std::shared_ptr<sse_session> session = find_session(session_id);
        if (!session) {
            LOG_WARNING("Session not found: ", session_id);
            res.status = 404;
            res.set_content(R"({"error":"Session not found"})", "application/json");
            return;
        }
        session->touch();

        // Parsed here so that no response can exist for an unparsed request
        json id;
        request mcp_req;
        try {
            mcp_req = request_handler::parse(req.body, id);
        } catch (const arsenal_exception& e) {
            LOG_ERROR("Failed to parse request for session ", session_id, ": ", e.what());
            write_reply(res, request_handler::protocol_error(id, e.what()));
            return;
        }

        bool queued = request_executor_.post([this, mcp_req, session]() {
            response result = dispatcher_.handle(mcp_req);
            if (mcp_req.is_notification()) {
                return;
            }
            if (!session->send(result.to_json())) {
                LOG_WARNING("Failed to deliver response, session closed: ", session->id());
            }
        });
        if (!queued) {
            LOG_ERROR("Cannot schedule request for session ", session_id, ": executor stopped");
            res.status = 503;
            res.set_content(R"({"error":"Server shutting down"})", "application/json");
            return;
        }

        res.status = 202;
        res.set_content("Accepted", "text/plain");
    }

    void server::handle_health(const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_content(health_.report().dump(), "application/json");
    }

    void server::write_reply(httplib::Response& res, const http_reply& reply) {
        res.status = reply.status;
        if (reply.body) {
            res.set_content(reply.body->dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        }
    }

    std::shared_ptr<sse_session> server::find_session(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    void server::close_session(const std::string& session_id) {
        std::shared_ptr<sse_session> session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(session_id);
            if (it != sessions_.end()) {
                session = it->second;
                sessions_.erase(it);
            }
        }

        // Close outside the lock, it joins the heartbeat thread
        if (session) {
            session->close();
        }
    }

    void server::maintenance_loop() {
        std::unique_lock<std::mutex> lock(maintenance_mutex_);
        while (running_) {
            maintenance_cv_.wait_for(lock, conf_.maintenance_interval, [this] {
                return !running_;
            });
            if (!running_) {
                break;
            }

            lock.unlock();
            check_inactive_sessions();
            lock.lock();
        }
    }

    void server::check_inactive_sessions() {
        const auto now = std::chrono::steady_clock::now();

        std::vector<std::string> sessions_to_close;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [session_id, session] : sessions_) {
                if (now - session->last_activity() > conf_.session_timeout) {
                    sessions_to_close.push_back(session_id);
                }
            }
        }

        for (const auto& session_id : sessions_to_close) {
            LOG_INFO("Closing inactive session: ", session_id);
            close_session(session_id);
        }
    }

    std::string server::generate_session_id() const {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << std::hex;

        // UUID layout 8-4-4-4-12
        const int groups[] = {8, 4, 4, 4, 12};
        for (size_t g = 0; g < 5; ++g) {
            if (g > 0) {
                ss << "-";
            }
            for (int i = 0; i < groups[g]; ++i) {
                ss << dis(gen);
            }
        }

        return ss.str();
    }

} // namespace arsenal
