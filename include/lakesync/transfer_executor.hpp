#pragma once

#include "lakesync/transfer_backend.hpp"
#include "lakesync/transfer_types.hpp"

#include <chrono>
#include <memory>

namespace lakesync {

/// Runs one batch on the backend for the selected mode and guarantees exactly
/// one outcome per task, in batch order. Backend exceptions and malformed
/// results become per-task failures; execute() itself does not throw.
class TransferExecutor {
public:
    TransferExecutor(std::shared_ptr<TransferBackend> direct,
                     std::shared_ptr<TransferBackend> traditional);

    /// nullptr when no backend is configured for the mode.
    TransferBackend* backend_for(ExecutionMode mode) const;

    /// Capability probe for a mode. Exceptions count as unavailable.
    bool probe(ExecutionMode mode, std::chrono::seconds timeout) const;

    BatchResult execute(const Batch& batch,
                        ExecutionMode mode,
                        std::chrono::steady_clock::time_point deadline =
                            std::chrono::steady_clock::time_point::max()) const;

private:
    static BatchResult fail_all(const Batch& batch, ErrorKind kind, const std::string& message);

    std::shared_ptr<TransferBackend> direct_;
    std::shared_ptr<TransferBackend> traditional_;
};

}  // namespace lakesync
