#include "lakesync/retry_policy.hpp"

#include <algorithm>
#include <cstdint>

namespace lakesync {

RetryPolicy::RetryPolicy(int retry_count,
                         std::chrono::milliseconds base_delay,
                         std::chrono::milliseconds max_delay)
    : retry_count_(retry_count)
    , base_delay_(base_delay)
    , max_delay_(max_delay) {}

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
    if (attempt < 1) attempt = 1;
    // Doubling past the cap is pointless and would overflow for large attempts.
    auto delay = base_delay_;
    for (int i = 1; i < attempt && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

RetryDecision RetryPolicy::should_retry(int attempt, ErrorKind kind) const {
    RetryDecision decision;
    if (!is_transient(kind) || attempt >= retry_count_) {
        return decision;
    }

    decision.retry = true;
    decision.backoff = backoff_for(attempt);

    if (jitter_ && jitter_ratio_ > 0.0) {
        double factor = std::clamp(jitter_(), 0.0, 1.0);
        auto reduction = static_cast<int64_t>(
            static_cast<double>(decision.backoff.count()) * jitter_ratio_ * factor);
        decision.backoff -= std::chrono::milliseconds(reduction);
    }
    return decision;
}

void RetryPolicy::set_jitter(JitterSource source, double jitter_ratio) {
    jitter_ = std::move(source);
    jitter_ratio_ = std::clamp(jitter_ratio, 0.0, 1.0);
}

}  // namespace lakesync
