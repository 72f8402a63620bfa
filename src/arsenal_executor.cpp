#include "arsenal_executor.h"
#include "arsenal_logger.h"

#include <memory>

namespace arsenal {

    tool_executor::tool_executor(std::string name, size_t num_threads)
        : name_(std::move(name)) {
        if (num_threads == 0) {
            num_threads = 1;
        }

        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&tool_executor::worker_loop, this);
        }
        LOG_DEBUG("Executor ", name_, " started with ", num_threads, " workers");
    }

    tool_executor::~tool_executor() {
        shutdown();
    }

    std::future<tool_result> tool_executor::submit(tool_handler handler, json arguments) {
        auto task = std::make_shared<std::packaged_task<tool_result()>>(
            [handler = std::move(handler), arguments = std::move(arguments)]() {
                try {
                    return handler(arguments);
                } catch (const std::exception& e) {
                    return tool_result::failure(e.what());
                }
            });

        std::future<tool_result> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw executor_stopped(name_);
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    bool tool_executor::post(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                return false;
            }
            tasks_.emplace(std::move(task));
        }

        condition_.notify_one();
        return true;
    }

    void tool_executor::shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                return;
            }
            stop_ = true;
        }

        condition_.notify_all();

        for (std::thread& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        LOG_DEBUG("Executor ", name_, " stopped");
    }

    size_t tool_executor::pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    void tool_executor::worker_loop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this] {
                    return stop_ || !tasks_.empty();
                });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            // A posted task has no caller left to report to
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("Task on executor ", name_, " failed: ", e.what());
            }
        }
    }

} // namespace arsenal
