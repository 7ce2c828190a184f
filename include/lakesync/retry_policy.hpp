#pragma once

#include "lakesync/constants.hpp"
#include "lakesync/transfer_types.hpp"

#include <chrono>
#include <functional>

namespace lakesync {

struct RetryDecision {
    bool retry = false;
    std::chrono::milliseconds backoff{0};
};

/// Exponential backoff for transient task failures.
///
/// should_retry() is a pure function of (attempt, kind) unless a jitter
/// source is installed. attempt is the 1-based number of the attempt that
/// just failed; the task is attempted at most retry_count times in total.
class RetryPolicy {
public:
    /// Returns a factor in [0, 1]. Scales the backoff down by up to jitter_ratio.
    using JitterSource = std::function<double()>;

    explicit RetryPolicy(int retry_count,
                         std::chrono::milliseconds base_delay = constants::RETRY_BASE_DELAY,
                         std::chrono::milliseconds max_delay = constants::RETRY_MAX_DELAY);

    RetryDecision should_retry(int attempt, ErrorKind kind) const;

    /// Backoff before the attempt following `attempt` (no jitter applied).
    std::chrono::milliseconds backoff_for(int attempt) const;

    void set_jitter(JitterSource source, double jitter_ratio);

    int retry_count() const { return retry_count_; }

private:
    int retry_count_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    JitterSource jitter_;
    double jitter_ratio_ = 0.0;
};

}  // namespace lakesync
