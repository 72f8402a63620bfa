#include "arsenal_health.h"
#include "arsenal_time.h"

namespace arsenal {

    health_endpoint::health_endpoint(const tool_registry& registry, const health_info& info)
        : total_tools_(registry.size()) {
        snapshot_ = {
            {"status", "healthy"},
            {"server", info.server},
            {"version", info.version},
            {"platform", info.platform},
            {"total_tools", total_tools_},
            {"mcp_tools", total_tools_},
            {"arsenal_tools", info.arsenal_tools},
            {"bleeding_edge", info.bleeding_edge},
            {"capability_flags", info.capability_flags}
        };
    }

    json health_endpoint::report() const {
        json report = snapshot_;
        report["timestamp"] = iso8601_now();
        return report;
    }

} // namespace arsenal
