#pragma once

#include <cstdint>
#include <mutex>

namespace docanalyst::service {

// Caller-owned usage accounting. The adapter only writes to it.
class MetadataSink {
public:
    virtual ~MetadataSink() = default;

    virtual void update_metadata(std::int64_t tokens_used, int request_count) = 0;
};

// Running totals across any number of calls; safe to share between threads.
class UsageAccumulator final : public MetadataSink {
public:
    void update_metadata(std::int64_t tokens_used, int request_count) override;

    std::int64_t tokens_used() const;
    int request_count() const;
    int report_count() const;

private:
    mutable std::mutex mutex_;
    std::int64_t tokens_used_ = 0;
    int request_count_ = 0;
    int report_count_ = 0;
};

}  // namespace docanalyst::service
