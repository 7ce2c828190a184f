#pragma once

#include "lakesync/constants.hpp"
#include "lakesync/transfer_types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lakesync {

/// How BatchPlanner groups tasks before cutting them into batches.
enum class BatchStrategy {
    Sequential,  // input order
    Prefix       // grouped by source key prefix, groups in order of first appearance
};

const char* to_string(BatchStrategy strategy);
std::optional<BatchStrategy> parse_batch_strategy(const std::string& s);

/// What the bulk tool does with each object.
enum class SyncMode {
    Copy,  // cp, skipping objects whose size already matches
    Sync   // sync --delete --exact-timestamps, mirroring the source
};

const char* to_string(SyncMode mode);
std::optional<SyncMode> parse_sync_mode(const std::string& s);

/// Configuration for one sync invocation. Read-only once handed to the
/// coordinator; out-of-range values are rejected by validate(), never clamped.
struct SyncConfig {
    // Destination
    std::string destination_container;  // Required: bucket name
    std::string destination_prefix;

    // Engine tuning
    int max_concurrent = constants::DEFAULT_MAX_CONCURRENT;  // batches in flight, [1,50]
    int batch_size = constants::DEFAULT_BATCH_SIZE;          // tasks per batch, [1,1000]
    uint64_t chunk_size_bytes = 0;                           // 0 = size-tiered
    int retry_count = constants::DEFAULT_RETRY_COUNT;        // total attempts per task, [1,10]
    bool incremental = true;
    RequestedMode mode = RequestedMode::Auto;
    BatchStrategy batch_strategy = BatchStrategy::Sequential;

    // Bulk copy tool
    std::string direct_tool = constants::DEFAULT_DIRECT_TOOL;
    std::string source_region_hint;
    bool no_sign_request = false;  // public source buckets
    SyncMode sync_mode = SyncMode::Copy;
    int probe_timeout_secs = constants::DEFAULT_PROBE_TIMEOUT_SECS;

    // Object storage connection (endpoint, region, access_key, secret_key,
    // session_token, verify_ssl, path_style). Shared by source and destination.
    std::map<std::string, std::string> storage;

    // Whole-prefix sync, run instead of a task list when both prefixes are set.
    // Patterns are passed to the tool's --include / --exclude.
    std::string sync_source_prefix;  // s3://bucket/prefix/
    std::string sync_target_prefix;  // s3://bucket/prefix/
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    bool directory_sync() const { return !sync_source_prefix.empty(); }

    // Driver
    std::filesystem::path tasks_file;
    std::filesystem::path output_file;  // empty = stdout
    size_t deadline_secs = 0;           // 0 = no deadline, at most 30 days
    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECS;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<SyncConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill unset storage credentials from the AWS_* environment variables.
    void apply_defaults();

    /// Validate ranges and required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace lakesync
