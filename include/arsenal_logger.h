#ifndef ARSENAL_LOGGER_H
#define ARSENAL_LOGGER_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace arsenal {

    enum class log_level {
        debug = 0,
        info = 1,
        warning = 2,
        error = 3
    };

    class logger {
        public:
            static logger& instance() {
                static logger instance;
                return instance;
            }

            void set_level(log_level level) {
                std::lock_guard<std::mutex> lock(mutex_);
                level_ = level;
            }

            log_level level() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return level_;
            }

            // Accepts "debug", "info", "warning"/"warn", "error"; anything else keeps the current level
            bool set_level(const std::string& name) {
                if (name == "debug") {
                    set_level(log_level::debug);
                } else if (name == "info") {
                    set_level(log_level::info);
                } else if (name == "warning" || name == "warn") {
                    set_level(log_level::warning);
                } else if (name == "error") {
                    set_level(log_level::error);
                } else {
                    return false;
                }
                return true;
            }

            template<typename... Args>
            void debug(Args&&... args) {
                log(log_level::debug, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void info(Args&&... args) {
                log(log_level::info, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void warning(Args&&... args) {
                log(log_level::warning, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void error(Args&&... args) {
                log(log_level::error, std::forward<Args>(args)...);
            }

        private:
            logger() = default;

            logger(const logger&) = delete;
            logger& operator=(const logger&) = delete;

            template<typename... Args>
            void log(log_level level, Args&&... args) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (level < level_) {
                    return;
                }

                std::stringstream ss;

                auto now = std::chrono::system_clock::now();
                auto now_c = std::chrono::system_clock::to_time_t(now);
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

                std::tm tm_buf{};
#ifdef _WIN32
                localtime_s(&tm_buf, &now_c);
#else
                localtime_r(&now_c, &tm_buf);
#endif
                ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
                   << std::setfill('0') << std::setw(3) << ms.count() << ' ';

                switch (level) {
                    case log_level::debug:
                        ss << "[DEBUG] ";
                        break;
                    case log_level::info:
                        ss << "[INFO] ";
                        break;
                    case log_level::warning:
                        ss << "[WARNING] ";
                        break;
                    case log_level::error:
                        ss << "[ERROR] ";
                        break;
                }

                (ss << ... << std::forward<Args>(args));

                std::cerr << ss.str() << std::endl;
            }

            mutable std::mutex mutex_;
            log_level level_ = log_level::info;
    };

#define LOG_DEBUG(...) ::arsenal::logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::arsenal::logger::instance().info(__VA_ARGS__)
#define LOG_WARNING(...) ::arsenal::logger::instance().warning(__VA_ARGS__)
#define LOG_ERROR(...) ::arsenal::logger::instance().error(__VA_ARGS__)

} // namespace arsenal

#endif // ARSENAL_LOGGER_H
