#include "arsenal_tracer.h"
#include "arsenal_logger.h"

namespace arsenal {

    std::unique_ptr<scoped_span> log_tracer::span(const std::string& name) {
        return std::make_unique<log_span>(name);
    }

    log_span::log_span(std::string name)
        : name_(std::move(name)), start_(std::chrono::steady_clock::now()) {}

    log_span::~log_span() {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_);

        // replace invalid UTF-8 instead of throwing from a destructor
        std::string attributes = attributes_.dump(-1, ' ', false, json::error_handler_t::replace);

        if (error_.empty()) {
            LOG_DEBUG("span ", name_, " ", elapsed.count(), "us ", attributes);
        } else {
            LOG_DEBUG("span ", name_, " ", elapsed.count(), "us ", attributes, " error: ", error_);
        }
    }

    void log_span::set_attribute(const std::string& key, const json& value) {
        attributes_[key] = value;
    }

    void log_span::record_error(const std::string& message) {
        error_ = message;
    }

} // namespace arsenal
