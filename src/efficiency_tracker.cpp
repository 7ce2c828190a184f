#include "lakesync/efficiency_tracker.hpp"

#include <nlohmann/json.hpp>

namespace lakesync {

nlohmann::json report_to_json(const EfficiencyReport& report) {
    return {
        {"mode", to_string(report.mode)},
        {"tasks_total", report.tasks_total},
        {"tasks_succeeded", report.tasks_succeeded},
        {"tasks_skipped", report.tasks_skipped},
        {"tasks_failed", report.tasks_failed},
        {"bytes_transferred", report.bytes_transferred},
        {"operations_issued", report.operations_issued},
        {"operations_reduced", report.operations_reduced},
        {"batches", report.batches},
        {"retries", report.retries},
        {"wall_time_secs", report.wall_time_secs},
        {"estimated_baseline_time_secs", report.estimated_baseline_time_secs},
        {"success_rate", report.success_rate},
        {"efficiency_improvement", report.efficiency_improvement},
        {"speedup", report.speedup},
    };
}

EfficiencyTracker::EfficiencyTracker()
    : started_(std::chrono::steady_clock::now()) {}

void EfficiencyTracker::start() {
    std::lock_guard lock(mutex_);
    started_ = std::chrono::steady_clock::now();
}

void EfficiencyTracker::record_outcome(const TransferOutcome& outcome) {
    std::lock_guard lock(mutex_);
    switch (outcome.status) {
        case TransferStatus::Succeeded:
            ++succeeded_;
            if (outcome.bytes_transferred) bytes_ += *outcome.bytes_transferred;
            break;
        case TransferStatus::Skipped:
            ++skipped_;
            break;
        case TransferStatus::Failed:
            ++failed_;
            break;
    }
}

void EfficiencyTracker::record_batch(uint64_t operations_issued) {
    std::lock_guard lock(mutex_);
    ++batches_;
    operations_issued_ += operations_issued;
}

void EfficiencyTracker::record_retries(uint64_t count) {
    std::lock_guard lock(mutex_);
    retries_ += count;
}

EfficiencyReport EfficiencyTracker::finish(ExecutionMode mode) const {
    std::chrono::steady_clock::time_point started;
    {
        std::lock_guard lock(mutex_);
        started = started_;
    }
    return build_report(mode, std::chrono::steady_clock::now() - started);
}

EfficiencyReport EfficiencyTracker::build_report(ExecutionMode mode,
                                                 std::chrono::duration<double> wall_time) const {
    std::lock_guard lock(mutex_);

    EfficiencyReport r;
    r.mode = mode;
    r.tasks_succeeded = succeeded_;
    r.tasks_skipped = skipped_;
    r.tasks_failed = failed_;
    r.tasks_total = succeeded_ + skipped_ + failed_;
    r.bytes_transferred = bytes_;
    r.operations_issued = operations_issued_;
    r.batches = batches_;
    r.retries = retries_;

    // Each direct copy replaces a download to local disk plus an upload.
    r.operations_reduced = mode == ExecutionMode::Direct ? 2 * succeeded_ : 0;

    if (r.tasks_total > 0) {
        r.success_rate = static_cast<double>(r.tasks_succeeded) / static_cast<double>(r.tasks_total);
        r.efficiency_improvement =
            static_cast<double>(r.operations_reduced) / static_cast<double>(2 * r.tasks_total);
    }

    r.wall_time_secs = wall_time.count();
    r.estimated_baseline_time_secs =
        mode == ExecutionMode::Direct ? 2.0 * r.wall_time_secs : r.wall_time_secs;
    r.speedup = r.wall_time_secs > 0.0 ? r.estimated_baseline_time_secs / r.wall_time_secs : 1.0;
    return r;
}

}  // namespace lakesync
