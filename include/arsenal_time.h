#ifndef ARSENAL_TIME_H
#define ARSENAL_TIME_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace arsenal {

    // ISO-8601 UTC with microseconds, e.g. 2024-11-05T12:00:00.123456Z
    inline std::string iso8601_now() {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;

        std::tm tm_buf{};
#ifdef _WIN32
        gmtime_s(&tm_buf, &now_c);
#else
        gmtime_r(&now_c, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(6) << us.count() << 'Z';
        return ss.str();
    }

} // namespace arsenal

#endif // ARSENAL_TIME_H
