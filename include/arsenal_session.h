#ifndef ARSENAL_SESSION_H
#define ARSENAL_SESSION_H

#include "arsenal_message.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace arsenal {

    // Outbound buffer between the producers of a session (initialize, heartbeat,
    // responses) and the HTTP thread that streams them to the client.
    class event_queue {
        public:
            // Writes one framed event; returns false when the transport is gone
            using writer = std::function<bool(const std::string& event)>;

            event_queue() = default;

            ~event_queue() {
                close();
            }

            event_queue(const event_queue&) = delete;
            event_queue& operator=(const event_queue&) = delete;

            bool push(std::string event) {
                std::lock_guard<std::mutex> lk(m_);
                if (closed_) {
                    return false;
                }
                events_.push_back(std::move(event));
                cv_.notify_one();
                return true;
            }

            // Waits up to timeout for events and hands them to write in order.
            // Returns false once closed or when write fails; a timeout with
            // nothing to send returns true.
            bool wait_event(const writer& write, std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
                std::deque<std::string> batch;
                {
                    std::unique_lock<std::mutex> lk(m_);
                    cv_.wait_for(lk, timeout, [this] {
                        return closed_ || !events_.empty();
                    });

                    if (closed_) {
                        return false;
                    }

                    batch.swap(events_);
                }

                for (const auto& event : batch) {
                    if (!write(event)) {
                        close();
                        return false;
                    }
                }

                if (!batch.empty()) {
                    update_activity();
                }
                return true;
            }

            // Wakes every waiter and drops whatever is still buffered
            void close() {
                std::lock_guard<std::mutex> lk(m_);
                if (closed_) {
                    return;
                }
                closed_ = true;
                events_.clear();
                cv_.notify_all();
            }

            bool is_closed() const {
                std::lock_guard<std::mutex> lk(m_);
                return closed_;
            }

            size_t pending() const {
                std::lock_guard<std::mutex> lk(m_);
                return events_.size();
            }

            std::chrono::steady_clock::time_point last_activity() const {
                std::lock_guard<std::mutex> lk(m_);
                return last_activity_;
            }

            void update_activity() {
                std::lock_guard<std::mutex> lk(m_);
                last_activity_ = std::chrono::steady_clock::now();
            }

        private:
            mutable std::mutex m_;
            std::condition_variable cv_;
            std::deque<std::string> events_;
            bool closed_ = false;
            std::chrono::steady_clock::time_point last_activity_{std::chrono::steady_clock::now()};
    };

    enum class session_state {
        connecting,
        active,
        closed
    };

    const char* to_string(session_state state);

    // One open event stream. connecting -> active on start(), active -> closed
    // on close(), transport failure or destruction. Nothing is emitted after
    // the session is closed.
    class sse_session {
        public:
            // initialize_params is the payload of the first event
            sse_session(std::string id,
                json initialize_params,
                std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(30));

            ~sse_session();

            sse_session(const sse_session&) = delete;
            sse_session& operator=(const sse_session&) = delete;

            // Emits the initialize event and starts the heartbeat timer.
            // Throws std::logic_error unless the session is connecting.
            void start();

            // Queues a JSON-RPC message; false once the session is closed
            bool send(const json& message);

            // Streams queued events through write. Closes the session and
            // returns false when the transport fails or the session ended.
            bool pump(const event_queue::writer& write, std::chrono::milliseconds timeout);

            void close();

            session_state state() const;

            bool is_closed() const {
                return state() == session_state::closed;
            }

            const std::string& id() const { return id_; }

            std::chrono::steady_clock::time_point last_activity() const {
                return events_.last_activity();
            }

            void touch() {
                events_.update_activity();
            }

            uint64_t heartbeats_sent() const {
                return heartbeats_.load();
            }

            // SSE framing: "data: <json>\n\n"
            static std::string format_event(const json& message);

        private:
            void heartbeat_loop();

            const std::string id_;
            json initialize_params_;
            const std::chrono::milliseconds heartbeat_interval_;

            mutable std::mutex mutex_;
            std::condition_variable cv_;
            session_state state_ = session_state::connecting;

            event_queue events_;
            std::thread heartbeat_thread_;
            std::atomic<uint64_t> heartbeats_{0};
    };

} // namespace arsenal

#endif // ARSENAL_SESSION_H
