#pragma once

#include "lakesync/storage/storage_provider.hpp"
#include "lakesync/transfer_backend.hpp"

#include <memory>
#include <string>

namespace lakesync {

/// Read-then-write transfers through the storage layer: each object is
/// fetched into memory and written to the destination. No staging directory.
class TraditionalBackend : public TransferBackend {
public:
    TraditionalBackend(std::string destination_container,
                       std::string destination_prefix,
                       std::shared_ptr<storage::StorageProvider> provider);

    std::string type_name() const override { return "traditional"; }

    /// Always available.
    bool probe(std::chrono::seconds timeout) override;

    BatchResult execute(const Batch& batch,
                        std::chrono::steady_clock::time_point deadline) override;

private:
    TransferOutcome transfer_one(const TransferTask& task,
                                 const BatchParameters& params,
                                 uint64_t& operations);

    std::string destination_container_;
    std::string destination_prefix_;
    std::shared_ptr<storage::StorageProvider> provider_;
};

}  // namespace lakesync
