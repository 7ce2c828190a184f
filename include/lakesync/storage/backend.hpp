#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace lakesync::storage {

// HTTP-style outcome shared by every storage call. Local backends map errno
// onto 400/403/404/500 so callers classify failures the same way everywhere.
struct StorageStatus {
    bool success = false;
    long status_code = 0;
    bool network_error = false;
    std::string error_message;
};

struct ObjectMetadata {
    uint64_t size = 0;
};

struct HeadResult : StorageStatus {
    ObjectMetadata metadata;

    bool not_found() const { return !success && !network_error && status_code == 404; }
};

struct GetResult : StorageStatus {
    std::vector<uint8_t> data;
};

struct PutResult : StorageStatus {};

struct PutOptions {
    uint64_t part_size = 0;  // multipart threshold, 0 = backend default
};

/// One bucket (or local directory standing in for one). Calls never throw;
/// failures come back in the result.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual std::string type_name() const = 0;

    virtual HeadResult head(const std::string& key) const = 0;
    virtual GetResult get(const std::string& key) const = 0;
    virtual PutResult put(const std::string& key,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    /// Bucket reachable with the configured credentials.
    virtual bool is_healthy() const = 0;
};

class StorageBackendFactory {
public:
    /// "local" needs 'path'. "s3" needs 'bucket' and takes region, endpoint,
    /// access_key, secret_key, session_token, path_style, verify_ssl,
    /// connect_timeout and request_timeout. Each call is one request; callers
    /// own retries.
    /// Throws std::runtime_error on unknown types or bad parameters.
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);

    static std::unique_ptr<StorageBackend> create_local(const std::filesystem::path& root);
};

}  // namespace lakesync::storage
