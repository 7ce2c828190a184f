#include "lakesync/sync_coordinator.hpp"
#include "lakesync/log.hpp"
#include "lakesync/metrics.hpp"
#include "lakesync/mode_selector.hpp"

#include <algorithm>
#include <future>

#include <meridian/core/thread_pool.hpp>

namespace lakesync {

// State of one sync() call shared by its batch workers
struct SyncCoordinator::Run {
    ExecutionMode mode = ExecutionMode::Traditional;
    std::chrono::steady_clock::time_point deadline;
    EfficiencyTracker tracker;
    // Each slot is written by exactly one worker
    std::vector<std::optional<TransferOutcome>> outcomes;
};

SyncCoordinator::SyncCoordinator(SyncConfig config,
                                 std::shared_ptr<TransferBackend> direct,
                                 std::shared_ptr<TransferBackend> traditional,
                                 MetricsExporter* metrics)
    : config_(std::move(config))
    , executor_(std::move(direct), std::move(traditional))
    , retry_policy_(config_.retry_count)
    , metrics_(metrics) {
    std::string err = config_.validate();
    if (!err.empty()) {
        throw SyncError(ErrorKind::ConfigurationError, "Invalid configuration: " + err);
    }
}

void SyncCoordinator::cancel() {
    {
        std::lock_guard lock(cancel_mutex_);
        cancelled_ = true;
    }
    cancel_cv_.notify_all();
}

bool SyncCoordinator::expired(std::chrono::steady_clock::time_point deadline) const {
    return cancelled_.load() || std::chrono::steady_clock::now() >= deadline;
}

SyncResult SyncCoordinator::sync(const std::vector<TransferTask>& tasks) {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::time_point::max();
    if (config_.deadline_secs > 0) {
        // Saturate instead of overflowing the clock's representation
        auto now = Clock::now();
        auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
        if (config_.deadline_secs < static_cast<uint64_t>(headroom.count())) {
            deadline = now + std::chrono::seconds(config_.deadline_secs);
        }
    }
    return sync(tasks, deadline);
}

SyncResult SyncCoordinator::sync(const std::vector<TransferTask>& tasks,
                                 std::chrono::steady_clock::time_point deadline) {
    Run run;
    run.deadline = deadline;
    run.outcomes.resize(tasks.size());

    // Tasks that cannot be transferred at all never reach a backend
    std::vector<size_t> valid_indices;
    std::vector<TransferTask> valid_tasks;
    for (size_t i = 0; i < tasks.size(); ++i) {
        const auto& task = tasks[i];
        auto uri = ObjectUri::parse(task.source_locator);
        if (!uri) {
            finalize(run, i, TransferOutcome::failed(task, ErrorKind::ConfigurationError,
                                                     "unsupported source locator: " + task.source_locator));
        } else if (!is_safe_relative_path(task.destination_relative_path)) {
            finalize(run, i, TransferOutcome::failed(task, ErrorKind::ConfigurationError,
                                                     "destination path escapes prefix: " +
                                                     task.destination_relative_path));
        } else {
            valid_indices.push_back(i);
            valid_tasks.push_back(task);
        }
    }

    auto probe_timeout = std::chrono::seconds(config_.probe_timeout_secs);
    run.mode = ModeSelector::select(valid_tasks, config_, [this, probe_timeout] {
        return executor_.probe(ExecutionMode::Direct, probe_timeout);
    });

    if (config_.mode == RequestedMode::Direct && !valid_tasks.empty() &&
        !executor_.probe(ExecutionMode::Direct, probe_timeout)) {
        throw SyncError(ErrorKind::CapabilityUnavailable,
                        "Direct mode requested but '" + config_.direct_tool + "' is unavailable");
    }

    BatchPlanner planner(config_);
    auto batches = planner.plan(tasks, valid_indices);

    log_info("Sync: %zu tasks (%zu invalid), %zu batches, mode=%s, concurrency=%d",
             tasks.size(), tasks.size() - valid_tasks.size(), batches.size(),
             to_string(run.mode), config_.max_concurrent);

    run.tracker.start();

    if (!batches.empty()) {
        size_t threads = std::min(static_cast<size_t>(config_.max_concurrent), batches.size());
        meridian::ThreadPool pool(threads);

        std::vector<std::pair<std::vector<size_t>, std::future<void>>> futures;
        futures.reserve(batches.size());
        for (auto& batch : batches) {
            auto indices = batch.indices;
            futures.emplace_back(std::move(indices),
                pool.submit([this, &run, b = std::move(batch)]() mutable {
                    run_batch(run, std::move(b));
                }));
        }

        for (auto& [indices, future] : futures) {
            try {
                future.get();
            } catch (const std::exception& e) {
                log_error("Batch worker failed: %s", e.what());
                for (size_t idx : indices) {
                    if (!run.outcomes[idx]) {
                        finalize(run, idx, TransferOutcome::failed(tasks[idx], ErrorKind::Transient, e.what()));
                    }
                }
            }
        }

        pool.shutdown(true);
    }

    SyncResult result;
    result.outcomes.reserve(tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (!run.outcomes[i]) {
            finalize(run, i, TransferOutcome::failed(tasks[i], ErrorKind::Cancelled, "not executed"));
        }
        result.outcomes.push_back(std::move(*run.outcomes[i]));
    }

    result.report = run.tracker.finish(run.mode);
    if (metrics_) {
        metrics_->record_report(result.report);
    }

    log_info("Sync complete: %llu succeeded, %llu skipped, %llu failed, %llu bytes in %.2fs",
             static_cast<unsigned long long>(result.report.tasks_succeeded),
             static_cast<unsigned long long>(result.report.tasks_skipped),
             static_cast<unsigned long long>(result.report.tasks_failed),
             static_cast<unsigned long long>(result.report.bytes_transferred),
             result.report.wall_time_secs);
    return result;
}

void SyncCoordinator::run_batch(Run& run, Batch batch) {
    std::vector<int> attempts(batch.size(), 0);  // per original batch position
    std::vector<size_t> positions(batch.size());
    for (size_t i = 0; i < positions.size(); ++i) positions[i] = i;

    int attempt = 1;

    while (!batch.empty()) {
        if (expired(run.deadline)) {
            for (size_t i = 0; i < batch.size(); ++i) {
                auto outcome = TransferOutcome::failed(batch.tasks[i], ErrorKind::Cancelled,
                    cancelled_.load() ? "cancelled" : "deadline exceeded");
                outcome.attempts = attempts[positions[i]];
                finalize(run, batch.indices[i], std::move(outcome));
            }
            return;
        }

        BatchResult result;
        if (metrics_) {
            auto scope = metrics_->track_batch();
            result = executor_.execute(batch, run.mode, run.deadline);
        } else {
            result = executor_.execute(batch, run.mode, run.deadline);
        }

        run.tracker.record_batch(result.operations_issued);
        if (metrics_) {
            metrics_->record_batch(run.mode, result.operations_issued);
        }

        Batch retry;
        retry.shared_parameters = batch.shared_parameters;
        std::vector<size_t> retry_positions;
        std::chrono::milliseconds backoff{0};

        for (size_t i = 0; i < batch.size(); ++i) {
            auto& outcome = result.outcomes[i];
            size_t pos = positions[i];
            attempts[pos] = attempt;
            outcome.attempts = attempt;

            if (outcome.status == TransferStatus::Failed && outcome.error) {
                auto decision = retry_policy_.should_retry(attempt, *outcome.error);
                if (decision.retry) {
                    log_debug("Retry %d for %s: %s", attempt, outcome.task.source_locator.c_str(),
                              outcome.message.c_str());
                    backoff = std::max(backoff, decision.backoff);
                    retry.tasks.push_back(batch.tasks[i]);
                    retry.indices.push_back(batch.indices[i]);
                    retry_positions.push_back(pos);
                    continue;
                }
            }
            finalize(run, batch.indices[i], std::move(outcome));
        }

        if (retry.empty()) {
            return;
        }

        run.tracker.record_retries(retry.size());
        if (metrics_) {
            metrics_->record_retries(retry.size());
        }

        if (!wait_backoff(backoff, run.deadline)) {
            for (size_t i = 0; i < retry.size(); ++i) {
                auto outcome = TransferOutcome::failed(retry.tasks[i], ErrorKind::Cancelled,
                    cancelled_.load() ? "cancelled before retry" : "deadline exceeded before retry");
                outcome.attempts = attempts[retry_positions[i]];
                finalize(run, retry.indices[i], std::move(outcome));
            }
            return;
        }

        batch = std::move(retry);
        positions = std::move(retry_positions);
        ++attempt;
    }
}

bool SyncCoordinator::wait_backoff(std::chrono::milliseconds backoff,
                                   std::chrono::steady_clock::time_point deadline) {
    auto now = std::chrono::steady_clock::now();
    auto wake = deadline;
    if (deadline - now > backoff) {
        wake = now + backoff;
    }

    std::unique_lock lock(cancel_mutex_);
    cancel_cv_.wait_until(lock, wake, [this] { return cancelled_.load(); });
    return !expired(deadline);
}

void SyncCoordinator::finalize(Run& run, size_t index, TransferOutcome outcome) {
    if (outcome.status == TransferStatus::Failed) {
        log_warn("Failed %s -> %s: %s (%s)", outcome.task.source_locator.c_str(),
                 outcome.task.destination_relative_path.c_str(),
                 outcome.error ? to_string(*outcome.error) : "unknown",
                 outcome.message.c_str());
    }
    run.tracker.record_outcome(outcome);
    if (metrics_) {
        metrics_->record_outcome(outcome);
    }
    run.outcomes[index] = std::move(outcome);
}

}  // namespace lakesync
