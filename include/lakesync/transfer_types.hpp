#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace lakesync {

/// Parsed object locator: s3://container/key or file:///absolute/path.
struct ObjectUri {
    std::string scheme;     // "s3" or "file"
    std::string container;  // bucket name; empty for file://
    std::string key;        // object key; for file:// the path without leading '/'

    /// Parse a locator. Returns empty optional when the scheme is unknown,
    /// the bucket or key is missing, or the key contains a ".." segment.
    static std::optional<ObjectUri> parse(const std::string& uri);

    /// Directory part of the key ("a/b" for "a/b/c.zip", "" for "c.zip").
    std::string key_prefix() const;

    std::string to_string() const;
};

/// True if a relative path has no ".." segment and is not empty after
/// stripping leading slashes.
bool is_safe_relative_path(const std::string& path);

/// Join destination prefix and relative path into an object key.
/// Leading slashes on the relative path and trailing slashes on the prefix are dropped.
std::string join_key(const std::string& prefix, const std::string& relative_path);

/// One object move. Immutable once handed to the engine.
struct TransferTask {
    std::string source_locator;
    std::string destination_relative_path;
    std::optional<uint64_t> expected_size;  // supplied by the catalog when known
};

enum class ErrorKind {
    ConfigurationError,
    CapabilityUnavailable,
    PermissionDenied,
    NotFound,
    Transient,
    Cancelled
};

const char* to_string(ErrorKind kind);

/// Permanent kinds are final on first occurrence; only Transient is retried.
inline bool is_transient(ErrorKind kind) { return kind == ErrorKind::Transient; }

enum class TransferStatus {
    Succeeded,
    Skipped,
    Failed
};

const char* to_string(TransferStatus status);

/// Result for a single task. error is set iff status == Failed.
struct TransferOutcome {
    TransferTask task;
    TransferStatus status = TransferStatus::Failed;
    std::optional<uint64_t> bytes_transferred;
    std::optional<ErrorKind> error;
    std::string message;
    int attempts = 0;

    static TransferOutcome succeeded(const TransferTask& task, std::optional<uint64_t> bytes);
    static TransferOutcome skipped(const TransferTask& task);
    static TransferOutcome failed(const TransferTask& task, ErrorKind kind, std::string message);
};

enum class ExecutionMode {
    Direct,
    Traditional
};

const char* to_string(ExecutionMode mode);

/// Mode requested in configuration. Auto is resolved once per sync.
enum class RequestedMode {
    Auto,
    Direct,
    Traditional
};

const char* to_string(RequestedMode mode);
std::optional<RequestedMode> parse_requested_mode(const std::string& s);

/// Parameters shared by every task of a batch.
struct BatchParameters {
    uint64_t chunk_size_bytes = 0;
    bool skip_if_unchanged = true;
};

/// Group of tasks dispatched together. indices[i] is the position of
/// tasks[i] in the caller's original task list.
struct Batch {
    std::vector<TransferTask> tasks;
    std::vector<size_t> indices;
    BatchParameters shared_parameters;

    size_t size() const { return tasks.size(); }
    bool empty() const { return tasks.empty(); }
};

/// Fatal engine error: invalid configuration, or a forced backend that is not available.
class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

nlohmann::json outcome_to_json(const TransferOutcome& outcome);

}  // namespace lakesync
