#ifndef ARSENAL_HEALTH_H
#define ARSENAL_HEALTH_H

#include "arsenal_message.h"
#include "arsenal_registry.h"

#include <string>

namespace arsenal {

    struct health_info {
        std::string server;
        std::string version;
        std::string platform;
        json capability_flags = json::object();
        size_t arsenal_tools = 0;
        bool bleeding_edge = false;
    };

    // Liveness report. Every aggregate is computed once at construction;
    // report() only adds the current timestamp.
    class health_endpoint {
        public:
            health_endpoint(const tool_registry& registry, const health_info& info);

            json report() const;

            size_t total_tools() const { return total_tools_; }

        private:
            size_t total_tools_;
            json snapshot_;
    };

} // namespace arsenal

#endif // ARSENAL_HEALTH_H
