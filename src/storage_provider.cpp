#include "lakesync/storage/storage_provider.hpp"
#include "lakesync/log.hpp"

#include <filesystem>
#include <stdexcept>

namespace lakesync::storage {

ConfiguredStorageProvider::ConfiguredStorageProvider(std::map<std::string, std::string> params)
    : params_(std::move(params)) {}

std::shared_ptr<StorageBackend> ConfiguredStorageProvider::resolve(const ObjectUri& uri) {
    std::string cache_key = uri.scheme + "://" + uri.container;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(cache_key);
    if (it != backends_.end()) {
        return it->second;
    }

    std::shared_ptr<StorageBackend> backend = create(uri);
    backends_.emplace(cache_key, backend);
    log_debug("Storage: %s backend for %s", backend->type_name().c_str(), cache_key.c_str());
    return backend;
}

std::shared_ptr<StorageBackend> ConfiguredStorageProvider::create(const ObjectUri& uri) const {
    if (uri.scheme == "file") {
        return StorageBackendFactory::create_local("/");
    }

    if (uri.scheme != "s3") {
        throw std::runtime_error("Unsupported storage scheme: " + uri.scheme);
    }

    auto type_it = params_.find("type");
    std::string type = type_it != params_.end() && !type_it->second.empty() ? type_it->second : "s3";

    if (type == "local") {
        auto path_it = params_.find("path");
        if (path_it == params_.end() || path_it->second.empty()) {
            throw std::runtime_error("Local storage emulation requires 'path'");
        }
        return StorageBackendFactory::create_local(
            std::filesystem::path(path_it->second) / uri.container);
    }

    auto backend_params = params_;
    backend_params.erase("type");
    backend_params.erase("path");
    backend_params["bucket"] = uri.container;
    return StorageBackendFactory::create(type, backend_params);
}

}  // namespace lakesync::storage
