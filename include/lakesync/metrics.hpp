#pragma once

#include "lakesync/efficiency_tracker.hpp"
#include "lakesync/transfer_types.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace lakesync {

/// Prometheus metrics for a sync, written to a textfile-collector .prom file.
///
/// A background thread rewrites the file every write_interval (temp file then
/// rename); stop() writes a last snapshot. Recording calls are thread-safe.
class MetricsExporter {
public:
    /// Marks one backend call: bumps the in-flight gauge and, when it goes
    /// out of scope, drops the gauge and observes the call duration.
    class BatchScope {
    public:
        explicit BatchScope(MetricsExporter& owner);
        ~BatchScope();
        BatchScope(const BatchScope&) = delete;
        BatchScope& operator=(const BatchScope&) = delete;

    private:
        MetricsExporter& owner_;
        std::chrono::steady_clock::time_point started_;
    };

    MetricsExporter(std::filesystem::path prom_file,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();
    void stop();

    BatchScope track_batch() { return BatchScope(*this); }

    void record_outcome(const TransferOutcome& outcome);
    void record_batch(ExecutionMode mode, uint64_t operations_issued);
    void record_retries(uint64_t count);
    void record_report(const EfficiencyReport& report);

    /// Returns false (and logs) when the file could not be replaced.
    bool write_snapshot();

private:
    prometheus::Counter& counter(const std::string& name, const std::string& help,
                                 const std::map<std::string, std::string>& extra = {});
    prometheus::Gauge& gauge(const std::string& name, const std::string& help);

    std::filesystem::path prom_file_;
    std::chrono::seconds write_interval_;
    std::map<std::string, std::string> labels_;
    std::shared_ptr<prometheus::Registry> registry_;

    std::map<TransferStatus, prometheus::Counter*> tasks_by_status_;
    std::map<ErrorKind, prometheus::Counter*> failures_by_kind_;
    std::map<ExecutionMode, prometheus::Counter*> batches_by_mode_;
    prometheus::Counter* bytes_ = nullptr;
    prometheus::Counter* operations_ = nullptr;
    prometheus::Counter* retries_ = nullptr;

    prometheus::Gauge* in_flight_ = nullptr;
    prometheus::Gauge* last_tasks_ = nullptr;
    prometheus::Gauge* last_success_rate_ = nullptr;
    prometheus::Gauge* last_improvement_ = nullptr;
    prometheus::Gauge* last_speedup_ = nullptr;
    prometheus::Gauge* last_direct_ = nullptr;

    prometheus::Histogram* batch_seconds_ = nullptr;
    prometheus::Histogram* sync_seconds_ = nullptr;

    std::mutex state_mutex_;
    std::condition_variable wake_;
    bool running_ = false;
    std::thread writer_;

    std::mutex file_mutex_;
};

}  // namespace lakesync
