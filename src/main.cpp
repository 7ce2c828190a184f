#include "lakesync/direct_copy_backend.hpp"
#include "lakesync/log.hpp"
#include "lakesync/metrics.hpp"
#include "lakesync/storage/storage_provider.hpp"
#include "lakesync/sync_config.hpp"
#include "lakesync/sync_coordinator.hpp"
#include "lakesync/traditional_backend.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>

#include <nlohmann/json.hpp>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int EXIT_OK = 0;
constexpr int EXIT_TASKS_FAILED = 1;
constexpr int EXIT_FATAL = 2;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool is_secret_key(const std::string& k) {
    return k.find("key") != std::string::npos || k.find("secret") != std::string::npos ||
           k.find("token") != std::string::npos || k.find("credential") != std::string::npos;
}

// Task list: [{"source": "...", "destination": "...", "size": n}, ...]
std::optional<std::vector<lakesync::TransferTask>> load_tasks(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) {
        lakesync::log_error("Cannot open task list: %s", path.c_str());
        return std::nullopt;
    }

    try {
        auto j = nlohmann::json::parse(f);
        if (!j.is_array()) {
            lakesync::log_error("Task list must be a JSON array: %s", path.c_str());
            return std::nullopt;
        }

        std::vector<lakesync::TransferTask> tasks;
        tasks.reserve(j.size());
        for (const auto& item : j) {
            lakesync::TransferTask task;
            task.source_locator = item.at("source").get<std::string>();
            task.destination_relative_path = item.at("destination").get<std::string>();
            if (item.contains("size") && !item["size"].is_null()) {
                task.expected_size = item["size"].get<uint64_t>();
            }
            tasks.push_back(std::move(task));
        }
        return tasks;
    } catch (const std::exception& e) {
        lakesync::log_error("Failed to parse task list %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }
}

bool write_json(const nlohmann::json& j, const std::filesystem::path& output) {
    if (output.empty()) {
        std::cout << j.dump(2) << std::endl;
        return static_cast<bool>(std::cout);
    }

    auto tmp_path = output;
    tmp_path += ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::trunc);
        if (!ofs) {
            lakesync::log_error("Cannot write %s", tmp_path.c_str());
            return false;
        }
        ofs << j.dump(2) << "\n";
        if (!ofs.good()) {
            lakesync::log_error("Failed writing %s", tmp_path.c_str());
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, output, ec);
    if (ec) {
        lakesync::log_error("Cannot rename %s: %s", tmp_path.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool write_result(const lakesync::SyncResult& result, const std::filesystem::path& output) {
    nlohmann::json j;
    j["outcomes"] = nlohmann::json::array();
    for (const auto& outcome : result.outcomes) {
        j["outcomes"].push_back(lakesync::outcome_to_json(outcome));
    }
    j["report"] = lakesync::report_to_json(result.report);
    return write_json(j, output);
}

// --sync-source / --sync-target: one tool invocation for a whole prefix.
int run_directory_sync(const lakesync::SyncConfig& config) {
    lakesync::DirectCopyBackend direct(lakesync::DirectCopyOptions::from_config(config), nullptr);
    if (!direct.probe(std::chrono::seconds(config.probe_timeout_secs))) {
        lakesync::log_error("%s: '%s' is unavailable",
                            lakesync::to_string(lakesync::ErrorKind::CapabilityUnavailable),
                            config.direct_tool.c_str());
        return EXIT_FATAL;
    }

    auto deadline = std::chrono::steady_clock::time_point::max();
    if (config.deadline_secs > 0) {
        deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.deadline_secs);
    }

    auto result = direct.sync_directory(config.sync_source_prefix, config.sync_target_prefix,
                                        config.include_patterns, config.exclude_patterns, deadline);

    nlohmann::json j = {
        {"operation_type", "directory_sync"},
        {"sync_mode", lakesync::to_string(config.sync_mode)},
        {"success", result.success},
        {"source_prefix", result.source_prefix},
        {"target_prefix", result.target_prefix},
        {"return_code", result.exit_code},
        {"objects_copied", result.objects_copied},
        {"objects_failed", result.objects_failed},
    };
    if (!result.error_message.empty()) j["error"] = result.error_message;

    if (!write_json(j, config.output_file)) {
        return EXIT_FATAL;
    }
    return result.success ? EXIT_OK : EXIT_TASKS_FAILED;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = lakesync::SyncConfig::from_args(argc, argv);
    if (!config_opt) {
        return EXIT_FATAL;
    }
    auto config = std::move(*config_opt);

    lakesync::set_verbose(config.verbose);
    // stdout carries the JSON result
    lakesync::set_info_to_stderr(config.output_file.empty());

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_FATAL;
    }
    if (config.directory_sync()) {
        return run_directory_sync(config);
    }
    if (config.tasks_file.empty()) {
        std::cerr << "Configuration error: --tasks is required\n";
        return EXIT_FATAL;
    }

    auto tasks = load_tasks(config.tasks_file);
    if (!tasks) {
        return EXIT_FATAL;
    }

    lakesync::log_info("lakesync starting...");
    lakesync::log_info("  tasks: %zu from %s", tasks->size(), config.tasks_file.c_str());
    lakesync::log_info("  destination: s3://%s/%s", config.destination_container.c_str(),
                       config.destination_prefix.c_str());
    lakesync::log_info("  mode: %s", lakesync::to_string(config.mode));
    lakesync::log_info("  max-concurrent: %d, batch-size: %d, retry-count: %d",
                       config.max_concurrent, config.batch_size, config.retry_count);
    lakesync::log_info("  incremental: %s, sync-mode: %s", config.incremental ? "yes" : "no",
                       lakesync::to_string(config.sync_mode));
    for (auto& [k, v] : config.storage) {
        // Mask secrets in log output
        lakesync::log_info("  storage-%s: %s", k.c_str(), is_secret_key(k) ? "****" : v.c_str());
    }

    auto provider = std::make_shared<lakesync::storage::ConfiguredStorageProvider>(config.storage);

    try {
        auto dest = provider->resolve(lakesync::ObjectUri{"s3", config.destination_container, ""});
        if (!dest->is_healthy()) {
            lakesync::log_warn("Destination bucket %s is not reachable; transfers may fail",
                               config.destination_container.c_str());
        }
    } catch (const std::exception& e) {
        lakesync::log_error("Cannot set up destination storage: %s", e.what());
        return EXIT_FATAL;
    }

    auto direct = std::make_shared<lakesync::DirectCopyBackend>(
        lakesync::DirectCopyOptions::from_config(config), provider);
    auto traditional = std::make_shared<lakesync::TraditionalBackend>(
        config.destination_container, config.destination_prefix, provider);

    std::unique_ptr<lakesync::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<lakesync::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"destination", config.destination_container}});
        metrics->start();
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::optional<lakesync::SyncResult> result;
    try {
        lakesync::SyncCoordinator coordinator(config, direct, traditional, metrics.get());

        // Forward signals to the coordinator outside signal context
        std::atomic<bool> done{false};
        std::thread signal_watcher([&coordinator, &done] {
            while (!done.load()) {
                if (g_shutdown_requested) {
                    lakesync::log_warn("Shutdown requested, cancelling pending batches");
                    coordinator.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        try {
            result = coordinator.sync(*tasks);
        } catch (...) {
            done = true;
            signal_watcher.join();
            throw;
        }
        done = true;
        signal_watcher.join();
    } catch (const lakesync::SyncError& e) {
        lakesync::log_error("%s: %s", lakesync::to_string(e.kind()), e.what());
        if (metrics) metrics->stop();
        return EXIT_FATAL;
    } catch (const std::exception& e) {
        lakesync::log_error("Sync aborted: %s", e.what());
        if (metrics) metrics->stop();
        return EXIT_FATAL;
    }

    if (metrics) metrics->stop();

    if (!write_result(*result, config.output_file)) {
        return EXIT_FATAL;
    }

    return result->report.tasks_failed > 0 ? EXIT_TASKS_FAILED : EXIT_OK;
}
