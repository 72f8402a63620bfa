#include "arsenal_session.h"
#include "arsenal_logger.h"
#include "arsenal_time.h"

#include <stdexcept>

namespace arsenal {

    const char* to_string(session_state state) {
        switch (state) {
            case session_state::connecting:
                return "connecting";
            case session_state::active:
                return "active";
            case session_state::closed:
                return "closed";
        }
        return "unknown";
    }

    sse_session::sse_session(std::string id, json initialize_params, std::chrono::milliseconds heartbeat_interval)
        : id_(std::move(id)),
          initialize_params_(std::move(initialize_params)),
          heartbeat_interval_(heartbeat_interval) {
        if (heartbeat_interval_.count() <= 0) {
            throw std::invalid_argument("heartbeat interval must be positive");
        }
    }

    sse_session::~sse_session() {
        close();
        if (heartbeat_thread_.joinable()) {
            if (heartbeat_thread_.get_id() == std::this_thread::get_id()) {
                heartbeat_thread_.detach();
            } else {
                heartbeat_thread_.join();
            }
        }
    }

    void sse_session::start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != session_state::connecting) {
            throw std::logic_error(std::string("cannot start session in state ") + to_string(state_));
        }

        json params = initialize_params_;
        params["sessionId"] = id_;

        json event = {
            {"jsonrpc", ARSENAL_JSONRPC_VERSION},
            {"method", "initialize"},
            {"params", params}
        };

        // Queued before the state flips, so nothing can overtake it
        events_.push(format_event(event));
        state_ = session_state::active;

        heartbeat_thread_ = std::thread(&sse_session::heartbeat_loop, this);
        LOG_INFO("Session opened: ", id_);
    }

    bool sse_session::send(const json& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != session_state::active) {
            LOG_DEBUG("Dropping message for inactive session: ", id_);
            return false;
        }
        return events_.push(format_event(message));
    }

    bool sse_session::pump(const event_queue::writer& write, std::chrono::milliseconds timeout) {
        if (events_.wait_event(write, timeout)) {
            return true;
        }
        close();
        return false;
    }

    void sse_session::close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == session_state::closed) {
                return;
            }
            state_ = session_state::closed;
            events_.close();
        }
        cv_.notify_all();

        // Only the caller that performed the transition gets here
        if (heartbeat_thread_.joinable() && heartbeat_thread_.get_id() != std::this_thread::get_id()) {
            heartbeat_thread_.join();
        }
        LOG_INFO("Session closed: ", id_, " after ", heartbeats_.load(), " heartbeats");
    }

    session_state sse_session::state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::string sse_session::format_event(const json& message) {
        return "data: " + message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
    }

    void sse_session::heartbeat_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        uint64_t sequence = 0;

        while (state_ == session_state::active) {
            bool stopped = cv_.wait_for(lock, heartbeat_interval_, [this] {
                return state_ != session_state::active;
            });
            if (stopped) {
                break;
            }

            json heartbeat = {
                {"jsonrpc", ARSENAL_JSONRPC_VERSION},
                {"method", "heartbeat"},
                {"params", {
                    {"timestamp", iso8601_now()},
                    {"sequence", ++sequence}
                }}
            };

            // Pushed under the session lock: close() cannot interleave
            if (!events_.push(format_event(heartbeat))) {
                LOG_WARNING("Failed to queue heartbeat, client may have disconnected: ", id_);
                break;
            }
            ++heartbeats_;
        }
    }

} // namespace arsenal
