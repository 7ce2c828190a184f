#pragma once

#include "lakesync/storage/backend.hpp"
#include "lakesync/transfer_types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lakesync::storage {

// Resolves an object locator to the backend that holds it.
class StorageProvider {
public:
    virtual ~StorageProvider() = default;

    // Throws std::runtime_error when no backend can be built for the locator.
    virtual std::shared_ptr<StorageBackend> resolve(const ObjectUri& uri) = 0;
};

// Builds backends from the SyncConfig storage map and caches one per
// (scheme, container).
//
//   file:///path        -> local backend rooted at "/"
//   s3://bucket/key     -> S3 backend for bucket, or <path>/<bucket> when
//                          storage["type"] == "local"
class ConfiguredStorageProvider : public StorageProvider {
public:
    explicit ConfiguredStorageProvider(std::map<std::string, std::string> params);

    std::shared_ptr<StorageBackend> resolve(const ObjectUri& uri) override;

private:
    std::shared_ptr<StorageBackend> create(const ObjectUri& uri) const;

    std::map<std::string, std::string> params_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<StorageBackend>> backends_;
};

}  // namespace lakesync::storage
