#include "lakesync/metrics.hpp"
#include "lakesync/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace lakesync {

MetricsExporter::BatchScope::BatchScope(MetricsExporter& owner)
    : owner_(owner), started_(std::chrono::steady_clock::now()) {
    owner_.in_flight_->Increment();
}

MetricsExporter::BatchScope::~BatchScope() {
    owner_.in_flight_->Decrement();
    owner_.batch_seconds_->Observe(
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count());
}

MetricsExporter::MetricsExporter(std::filesystem::path prom_file,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_(std::move(prom_file)),
      write_interval_(write_interval),
      labels_(labels),
      registry_(std::make_shared<prometheus::Registry>()) {
    for (auto status : {TransferStatus::Succeeded, TransferStatus::Skipped, TransferStatus::Failed}) {
        tasks_by_status_[status] = &counter("lakesync_tasks_total", "Tasks finalized, by status",
                                            {{"status", to_string(status)}});
    }
    for (auto kind : {ErrorKind::ConfigurationError, ErrorKind::CapabilityUnavailable,
                      ErrorKind::PermissionDenied, ErrorKind::NotFound,
                      ErrorKind::Transient, ErrorKind::Cancelled}) {
        failures_by_kind_[kind] = &counter("lakesync_task_failures_total",
                                           "Failed tasks, by error kind",
                                           {{"error", to_string(kind)}});
    }
    for (auto mode : {ExecutionMode::Direct, ExecutionMode::Traditional}) {
        batches_by_mode_[mode] = &counter("lakesync_batches_total", "Backend calls, by execution mode",
                                          {{"mode", to_string(mode)}});
    }
    bytes_ = &counter("lakesync_bytes_transferred_total", "Bytes copied by succeeded tasks");
    operations_ = &counter("lakesync_operations_issued_total", "Storage operations issued by backends");
    retries_ = &counter("lakesync_retries_total", "Task retries scheduled");

    in_flight_ = &gauge("lakesync_batches_in_flight", "Backend calls currently running");
    last_tasks_ = &gauge("lakesync_last_sync_tasks", "Tasks in the last sync");
    last_success_rate_ = &gauge("lakesync_last_sync_success_rate", "Succeeded / total, last sync");
    last_improvement_ = &gauge("lakesync_last_sync_efficiency_improvement",
                               "Operations avoided / baseline operations, last sync");
    last_speedup_ = &gauge("lakesync_last_sync_speedup", "Estimated baseline time / wall time, last sync");
    last_direct_ = &gauge("lakesync_last_sync_direct_mode", "1 when the last sync ran in direct mode");

    batch_seconds_ = &prometheus::BuildHistogram()
        .Name("lakesync_batch_duration_seconds")
        .Help("Backend call duration")
        .Labels(labels_)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{0.05, 0.25, 1, 5, 15, 60, 300, 900});
    sync_seconds_ = &prometheus::BuildHistogram()
        .Name("lakesync_sync_duration_seconds")
        .Help("Whole sync duration")
        .Labels(labels_)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{1, 10, 60, 300, 1800, 3600, 4 * 3600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

// Families are looked up by name, so repeated calls add series to one family.
prometheus::Counter& MetricsExporter::counter(const std::string& name, const std::string& help,
                                              const std::map<std::string, std::string>& extra) {
    return prometheus::BuildCounter()
        .Name(name)
        .Help(help)
        .Labels(labels_)
        .Register(*registry_)
        .Add(extra);
}

prometheus::Gauge& MetricsExporter::gauge(const std::string& name, const std::string& help) {
    return prometheus::BuildGauge()
        .Name(name)
        .Help(help)
        .Labels(labels_)
        .Register(*registry_)
        .Add({});
}

void MetricsExporter::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_) return;
    running_ = true;
    writer_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(state_mutex_);
        while (!wake_.wait_for(lock, write_interval_, [this] { return !running_; })) {
            lock.unlock();
            write_snapshot();
            lock.lock();
        }
    });
}

void MetricsExporter::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (writer_.joinable()) writer_.join();
    write_snapshot();
}

void MetricsExporter::record_outcome(const TransferOutcome& outcome) {
    tasks_by_status_.at(outcome.status)->Increment();
    if (outcome.status == TransferStatus::Succeeded && outcome.bytes_transferred) {
        bytes_->Increment(static_cast<double>(*outcome.bytes_transferred));
    }
    if (outcome.status == TransferStatus::Failed && outcome.error) {
        failures_by_kind_.at(*outcome.error)->Increment();
    }
}

void MetricsExporter::record_batch(ExecutionMode mode, uint64_t operations_issued) {
    batches_by_mode_.at(mode)->Increment();
    operations_->Increment(static_cast<double>(operations_issued));
}

void MetricsExporter::record_retries(uint64_t count) {
    retries_->Increment(static_cast<double>(count));
}

void MetricsExporter::record_report(const EfficiencyReport& report) {
    last_tasks_->Set(static_cast<double>(report.tasks_total));
    last_success_rate_->Set(report.success_rate);
    last_improvement_->Set(report.efficiency_improvement);
    last_speedup_->Set(report.speedup);
    last_direct_->Set(report.mode == ExecutionMode::Direct ? 1.0 : 0.0);
    sync_seconds_->Observe(report.wall_time_secs);
}

bool MetricsExporter::write_snapshot() {
    std::lock_guard<std::mutex> lock(file_mutex_);

    auto partial = prom_file_;
    partial += ".partial";
    {
        std::ofstream out(partial, std::ios::trunc);
        out << prometheus::TextSerializer().Serialize(registry_->Collect());
        if (!out.flush()) {
            log_warn("Metrics: cannot write %s", partial.c_str());
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(partial, prom_file_, ec);
    if (ec) {
        log_warn("Metrics: cannot replace %s: %s", prom_file_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace lakesync
