#include "service/metadata_sink.hpp"

namespace docanalyst::service {

void UsageAccumulator::update_metadata(const std::int64_t tokens_used,
                                       const int request_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_used_ += tokens_used;
    request_count_ += request_count;
    ++report_count_;
}

std::int64_t UsageAccumulator::tokens_used() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_used_;
}

int UsageAccumulator::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_count_;
}

int UsageAccumulator::report_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_count_;
}

}  // namespace docanalyst::service
