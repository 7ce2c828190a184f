#include "lakesync/transfer_types.hpp"

#include <nlohmann/json.hpp>

namespace lakesync {

namespace {

// True if any '/'-separated segment of path equals "..".
bool has_parent_segment(const std::string& path) {
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        if (path.compare(pos, slash - pos, "..") == 0 && slash - pos == 2) {
            return true;
        }
        pos = slash + 1;
    }
    return false;
}

std::string strip_leading_slashes(const std::string& s) {
    size_t start = s.find_first_not_of('/');
    return start == std::string::npos ? std::string() : s.substr(start);
}

}  // namespace

// --- ObjectUri ---

std::optional<ObjectUri> ObjectUri::parse(const std::string& uri) {
    auto sep = uri.find("://");
    if (sep == std::string::npos) return std::nullopt;

    ObjectUri result;
    result.scheme = uri.substr(0, sep);
    std::string rest = uri.substr(sep + 3);

    if (result.scheme == "s3") {
        auto slash = rest.find('/');
        if (slash == std::string::npos || slash == 0) return std::nullopt;
        result.container = rest.substr(0, slash);
        result.key = rest.substr(slash + 1);
    } else if (result.scheme == "file") {
        // file:///abs/path -> rest = "/abs/path"
        if (rest.empty() || rest[0] != '/') return std::nullopt;
        result.key = strip_leading_slashes(rest);
    } else {
        return std::nullopt;
    }

    if (result.key.empty() || result.key.back() == '/') return std::nullopt;
    if (has_parent_segment(result.key)) return std::nullopt;
    return result;
}

std::string ObjectUri::key_prefix() const {
    auto slash = key.rfind('/');
    return slash == std::string::npos ? std::string() : key.substr(0, slash);
}

std::string ObjectUri::to_string() const {
    if (scheme == "file") return "file:///" + key;
    return scheme + "://" + container + "/" + key;
}

bool is_safe_relative_path(const std::string& path) {
    auto stripped = strip_leading_slashes(path);
    if (stripped.empty()) return false;
    return !has_parent_segment(stripped);
}

std::string join_key(const std::string& prefix, const std::string& relative_path) {
    std::string p = prefix;
    while (!p.empty() && p.back() == '/') p.pop_back();
    p = strip_leading_slashes(p);
    auto rel = strip_leading_slashes(relative_path);
    if (p.empty()) return rel;
    return p + "/" + rel;
}

// --- Enumerations ---

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::CapabilityUnavailable: return "CapabilityUnavailable";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Transient: return "Transient";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Transient";
}

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Succeeded: return "succeeded";
        case TransferStatus::Skipped: return "skipped";
        case TransferStatus::Failed: return "failed";
    }
    return "failed";
}

const char* to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Direct: return "direct";
        case ExecutionMode::Traditional: return "traditional";
    }
    return "traditional";
}

const char* to_string(RequestedMode mode) {
    switch (mode) {
        case RequestedMode::Auto: return "auto";
        case RequestedMode::Direct: return "direct";
        case RequestedMode::Traditional: return "traditional";
    }
    return "auto";
}

std::optional<RequestedMode> parse_requested_mode(const std::string& s) {
    if (s == "auto") return RequestedMode::Auto;
    if (s == "direct") return RequestedMode::Direct;
    if (s == "traditional") return RequestedMode::Traditional;
    return std::nullopt;
}

// --- TransferOutcome ---

TransferOutcome TransferOutcome::succeeded(const TransferTask& task, std::optional<uint64_t> bytes) {
    TransferOutcome o;
    o.task = task;
    o.status = TransferStatus::Succeeded;
    o.bytes_transferred = bytes;
    return o;
}

TransferOutcome TransferOutcome::skipped(const TransferTask& task) {
    TransferOutcome o;
    o.task = task;
    o.status = TransferStatus::Skipped;
    return o;
}

TransferOutcome TransferOutcome::failed(const TransferTask& task, ErrorKind kind, std::string message) {
    TransferOutcome o;
    o.task = task;
    o.status = TransferStatus::Failed;
    o.error = kind;
    o.message = std::move(message);
    return o;
}

nlohmann::json outcome_to_json(const TransferOutcome& outcome) {
    nlohmann::json j;
    j["source"] = outcome.task.source_locator;
    j["destination"] = outcome.task.destination_relative_path;
    j["status"] = to_string(outcome.status);
    j["attempts"] = outcome.attempts;
    if (outcome.bytes_transferred) j["bytes_transferred"] = *outcome.bytes_transferred;
    if (outcome.error) j["error"] = to_string(*outcome.error);
    if (!outcome.message.empty()) j["message"] = outcome.message;
    return j;
}

}  // namespace lakesync
