#ifndef ARSENAL_TRACER_H
#define ARSENAL_TRACER_H

#include "arsenal_message.h"

#include <chrono>
#include <memory>
#include <string>

namespace arsenal {

    // One traced operation. The span ends when the object is destroyed.
    class scoped_span {
        public:
            virtual ~scoped_span() = default;

            virtual void set_attribute(const std::string& key, const json& value) = 0;

            virtual void record_error(const std::string& message) = 0;
    };

    // Optional tracing collaborator; the dispatcher treats a null tracer as disabled
    class tracer {
        public:
            virtual ~tracer() = default;

            virtual std::unique_ptr<scoped_span> span(const std::string& name) = 0;
    };

    // Writes each finished span as one debug log line
    class log_tracer : public tracer {
        public:
            std::unique_ptr<scoped_span> span(const std::string& name) override;
    };

    class log_span : public scoped_span {
        public:
            explicit log_span(std::string name);
            ~log_span() override;

            void set_attribute(const std::string& key, const json& value) override;

            void record_error(const std::string& message) override;

        private:
            std::string name_;
            json attributes_ = json::object();
            std::string error_;
            std::chrono::steady_clock::time_point start_;
    };

} // namespace arsenal

#endif // ARSENAL_TRACER_H
