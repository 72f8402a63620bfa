#ifndef ARSENAL_CATALOG_H
#define ARSENAL_CATALOG_H

#include "arsenal_message.h"
#include "arsenal_registry.h"
#include "arsenal_tool.h"
#include "arsenal_tracer.h"

#include <memory>
#include <string>
#include <vector>

namespace arsenal {

    struct tool_category {
        std::string name;
        int count;
        std::string description;
        bool bleeding_edge_enhanced;
        std::vector<std::string> tools;
    };

    struct bleeding_edge_config {
        bool enabled;
        std::string priority;
        std::vector<std::string> repositories;
        int additional_tools_count;
        std::string update_frequency;
    };

    // Static description of the security tool arsenal plus the text
    // renderers behind the catalog tools. All output is deterministic.
    class arsenal_catalog {
        public:
            explicit arsenal_catalog(std::string platform);

            const std::vector<tool_category>& categories() const { return categories_; }

            // nullptr when no category has that exact name
            const tool_category* find(const std::string& name) const;

            const bleeding_edge_config& bleeding_edge() const { return bleeding_edge_; }

            const std::string& platform() const { return platform_; }

            int standard_tool_count() const { return standard_tool_count_; }

            // Standard plus bleeding-edge tools
            int total_tool_count() const { return standard_tool_count_ + bleeding_edge_.additional_tools_count; }

            size_t category_count() const { return categories_.size(); }

            std::string render_arsenal_info() const;

            // Fails with the list of valid names for an unknown category
            tool_result render_category(const std::string& name) const;

            std::string render_scan(const std::string& target, const std::string& scan_type) const;

            std::string render_bleeding_edge_status() const;

            std::string render_report(const std::string& report_type) const;

        private:
            std::string platform_;
            std::vector<tool_category> categories_;
            bleeding_edge_config bleeding_edge_;
            int standard_tool_count_ = 0;
    };

    // Feature flags advertised by initialize and the health endpoint
    json default_capabilities();

    // Scans are traced as "security.scan" spans when a tracer is given
    void register_catalog_tools(tool_registry& registry,
        std::shared_ptr<const arsenal_catalog> catalog,
        std::shared_ptr<tracer> tracer = nullptr);

} // namespace arsenal

#endif // ARSENAL_CATALOG_H
