#pragma once

#include "lakesync/storage/storage_provider.hpp"
#include "lakesync/sync_config.hpp"
#include "lakesync/transfer_backend.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lakesync {

/// One object copy handed to the bulk tool.
struct CopyDescriptor {
    std::string source;       // s3://bucket/key
    std::string destination;  // s3://bucket/key
    bool overwrite_if_unchanged = false;  // false -> --if-size-differ
    std::string source_region_hint;
    uint64_t chunk_size_bytes = 0;
    SyncMode mode = SyncMode::Copy;

    /// Copy: cp [--if-size-differ] [--source-region R] --part-size <MiB> 'src' 'dst'
    /// Sync: sync --delete --exact-timestamps 'src' 'dst'
    std::string to_command_line() const;
};

/// Single-quote a string for the bulk tool's command-list parser.
std::string quote_argument(const std::string& s);

/// Split a command line the way a POSIX shell would: blanks separate words,
/// single quotes are literal, double quotes and backslashes escape.
std::vector<std::string> split_command_line(const std::string& line);

/// One command line per descriptor, in order, newline-terminated.
std::string render_command_list(const std::vector<CopyDescriptor>& descriptors);

struct DirectCopyOptions {
    std::string destination_container;
    std::string destination_prefix;

    std::string tool = constants::DEFAULT_DIRECT_TOOL;
    int num_workers = constants::DEFAULT_MAX_CONCURRENT;
    int retry_count = constants::DEFAULT_RETRY_COUNT;  // directory sync only
    SyncMode sync_mode = SyncMode::Copy;
    std::string source_region_hint;
    bool no_sign_request = false;
    std::string endpoint;             // --endpoint-url, empty = AWS
    bool verify_ssl = true;
    std::map<std::string, std::string> env;  // credentials for the child process
    std::filesystem::path work_dir;   // command-list files; empty = temp directory

    static DirectCopyOptions from_config(const SyncConfig& config);
};

/// Outcome of one whole-prefix sync.
struct DirectorySyncResult {
    bool success = false;
    int exit_code = -1;
    std::string source_prefix;
    std::string target_prefix;
    uint64_t objects_copied = 0;  // success lines reported by the tool
    uint64_t objects_failed = 0;  // error lines reported by the tool
    std::string stdout_data;
    std::string stderr_data;
    std::string error_message;
};

/// Server-side copies through an external bulk tool (s5cmd-compatible):
/// each batch becomes one `run <command-file>` invocation.
///
/// With skip_if_unchanged the destination is stat'ed first through the
/// provider (when one is given) so unchanged objects are reported as skipped
/// without reaching the tool.
class DirectCopyBackend : public TransferBackend {
public:
    DirectCopyBackend(DirectCopyOptions options,
                      std::shared_ptr<storage::StorageProvider> provider);

    /// Only s3:// sources are copied server-side.
    static bool supports_source(const ObjectUri& uri) { return uri.scheme == "s3"; }

    std::string type_name() const override { return "direct"; }

    bool probe(std::chrono::seconds timeout) override;

    BatchResult execute(const Batch& batch,
                        std::chrono::steady_clock::time_point deadline) override;

    /// Command prefix used for a batch, without the command file.
    std::vector<std::string> base_command() const;

    /// tool [flags] sync [--include p]... [--exclude p]... [--delete] src dst
    /// --delete is added in SyncMode::Sync.
    std::vector<std::string> directory_sync_command(const std::string& source_prefix,
                                                    const std::string& target_prefix,
                                                    const std::vector<std::string>& include_patterns,
                                                    const std::vector<std::string>& exclude_patterns) const;

    /// Mirror source_prefix into target_prefix with a single tool invocation.
    /// The tool retries on its own (retry_count - 1 times); the child is killed
    /// at the deadline. Never throws.
    DirectorySyncResult sync_directory(const std::string& source_prefix,
                                       const std::string& target_prefix,
                                       const std::vector<std::string>& include_patterns,
                                       const std::vector<std::string>& exclude_patterns,
                                       std::chrono::steady_clock::time_point deadline =
                                           std::chrono::steady_clock::time_point::max());

private:
    std::vector<std::string> global_flags(int tool_retries) const;

    void apply_tool_output(const std::string& output,
                           const Batch& batch,
                           const std::vector<CopyDescriptor>& descriptors,
                           const std::vector<size_t>& positions,
                           BatchResult& result,
                           std::vector<bool>& resolved) const;

    std::filesystem::path write_command_file(const std::string& contents) const;

    DirectCopyOptions options_;
    std::shared_ptr<storage::StorageProvider> provider_;
};

}  // namespace lakesync
