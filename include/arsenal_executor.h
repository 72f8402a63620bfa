#ifndef ARSENAL_EXECUTOR_H
#define ARSENAL_EXECUTOR_H

#include "arsenal_message.h"
#include "arsenal_tool.h"

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace arsenal {

    class executor_stopped : public std::runtime_error {
        public:
            explicit executor_stopped(const std::string& name)
                : std::runtime_error("Executor " + name + " stopped, cannot add task") {}
    };

    // Fixed set of workers that runs tool handlers and session-routed requests
    // off the HTTP worker threads. Work queued before shutdown still runs.
    class tool_executor {
        public:
            explicit tool_executor(std::string name, size_t num_threads = std::thread::hardware_concurrency());

            ~tool_executor();

            tool_executor(const tool_executor&) = delete;
            tool_executor& operator=(const tool_executor&) = delete;

            // Runs handler(arguments) on a worker. A std::exception thrown by the
            // handler comes back as tool_result::failure, never through the future.
            // Throws executor_stopped after shutdown().
            std::future<tool_result> submit(tool_handler handler, json arguments);

            // Fire-and-forget work; false once the executor is shut down
            bool post(std::function<void()> task);

            // Stops accepting work, drains the queue and joins the workers
            void shutdown();

            size_t size() const { return workers_.size(); }

            size_t pending() const;

            const std::string& name() const { return name_; }

        private:
            void worker_loop();

            const std::string name_;
            std::vector<std::thread> workers_;

            std::queue<std::function<void()>> tasks_;
            mutable std::mutex queue_mutex_;
            std::condition_variable condition_;
            bool stop_ = false;
    };

} // namespace arsenal

#endif // ARSENAL_EXECUTOR_H
