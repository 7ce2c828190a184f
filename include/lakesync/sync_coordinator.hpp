#pragma once

#include "lakesync/batch_planner.hpp"
#include "lakesync/efficiency_tracker.hpp"
#include "lakesync/retry_policy.hpp"
#include "lakesync/sync_config.hpp"
#include "lakesync/transfer_executor.hpp"
#include "lakesync/transfer_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace lakesync {

class MetricsExporter;

struct SyncResult {
    std::vector<TransferOutcome> outcomes;  // same order as the input tasks
    EfficiencyReport report;
};

/// Top-level entry point: selects the mode, plans batches, runs them on a
/// worker pool of config.max_concurrent threads, retries transient failures
/// and stitches the outcomes back into input order.
///
/// Every input task yields exactly one outcome. Only an invalid configuration
/// (at construction) and a forced direct mode whose backend is unavailable
/// (in sync) throw; both throw SyncError.
class SyncCoordinator {
public:
    /// Throws SyncError(ConfigurationError) when config.validate() fails.
    SyncCoordinator(SyncConfig config,
                    std::shared_ptr<TransferBackend> direct,
                    std::shared_ptr<TransferBackend> traditional,
                    MetricsExporter* metrics = nullptr);

    /// Run with the configured deadline (deadline_secs, 0 = none).
    SyncResult sync(const std::vector<TransferTask>& tasks);

    /// Batches that have not started by the deadline, and retries that would
    /// start after it, finish as Cancelled. Running backend calls complete.
    SyncResult sync(const std::vector<TransferTask>& tasks,
                    std::chrono::steady_clock::time_point deadline);

    /// Request cancellation from any thread. Sticky for this coordinator.
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    /// Replace the retry policy built from config.retry_count.
    void set_retry_policy(RetryPolicy policy) { retry_policy_ = std::move(policy); }

    const SyncConfig& config() const { return config_; }

private:
    struct Run;

    void run_batch(Run& run, Batch batch);
    void finalize(Run& run, size_t index, TransferOutcome outcome);

    /// Sleep for the backoff unless cancelled or past the deadline first.
    /// Returns false when the retry must not start.
    bool wait_backoff(std::chrono::milliseconds backoff,
                      std::chrono::steady_clock::time_point deadline);

    bool expired(std::chrono::steady_clock::time_point deadline) const;

    SyncConfig config_;
    TransferExecutor executor_;
    RetryPolicy retry_policy_;
    MetricsExporter* metrics_;

    std::atomic<bool> cancelled_{false};
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
};

}  // namespace lakesync
