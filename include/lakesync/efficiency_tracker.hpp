#pragma once

#include "lakesync/transfer_types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>

#include <nlohmann/json_fwd.hpp>

namespace lakesync {

/// Aggregate figures for one sync invocation.
/// tasks_succeeded + tasks_skipped + tasks_failed == tasks_total.
struct EfficiencyReport {
    ExecutionMode mode = ExecutionMode::Traditional;

    uint64_t tasks_total = 0;
    uint64_t tasks_succeeded = 0;
    uint64_t tasks_skipped = 0;
    uint64_t tasks_failed = 0;
    uint64_t bytes_transferred = 0;

    uint64_t operations_issued = 0;
    uint64_t operations_reduced = 0;  // local download+upload steps avoided (direct mode)
    uint64_t batches = 0;
    uint64_t retries = 0;

    double wall_time_secs = 0.0;
    double estimated_baseline_time_secs = 0.0;

    double success_rate = 0.0;            // succeeded / total
    double efficiency_improvement = 0.0;  // operations_reduced / (2 * total)
    double speedup = 1.0;                 // baseline / wall
};

nlohmann::json report_to_json(const EfficiencyReport& report);

/// Thread-safe counters fed by concurrent batch workers. One instance per
/// sync invocation; the report is derived once at the end.
class EfficiencyTracker {
public:
    EfficiencyTracker();

    /// Reset the wall clock. Called when dispatch begins.
    void start();

    /// Record a final task outcome.
    void record_outcome(const TransferOutcome& outcome);

    /// Record one backend call (first attempt or retry).
    void record_batch(uint64_t operations_issued);

    void record_retries(uint64_t count);

    /// Build the report using the elapsed time since start().
    EfficiencyReport finish(ExecutionMode mode) const;

    /// Build the report with an explicit wall time.
    EfficiencyReport build_report(ExecutionMode mode, std::chrono::duration<double> wall_time) const;

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point started_;

    uint64_t succeeded_ = 0;
    uint64_t skipped_ = 0;
    uint64_t failed_ = 0;
    uint64_t bytes_ = 0;
    uint64_t operations_issued_ = 0;
    uint64_t batches_ = 0;
    uint64_t retries_ = 0;
};

}  // namespace lakesync
