#pragma once

#include "lakesync/storage/storage_provider.hpp"
#include "lakesync/transfer_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lakesync {

/// Everything one backend call produced. outcomes[i] belongs to batch.tasks[i].
struct BatchResult {
    std::vector<TransferOutcome> outcomes;
    uint64_t operations_issued = 0;  // copy/get/put requests sent to storage
};

/// Moves the tasks of one batch. Implementations report per-task failures in
/// the outcomes and do not throw for storage or tool errors.
class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    virtual std::string type_name() const = 0;

    /// Lightweight availability check. Never retried; false means unavailable.
    virtual bool probe(std::chrono::seconds timeout) = 0;

    /// deadline bounds long-running external work; time_point::max() = none.
    virtual BatchResult execute(const Batch& batch,
                                std::chrono::steady_clock::time_point deadline) = 0;
};

/// Map a storage status to an error kind:
/// 401/403 -> PermissionDenied, 404 -> NotFound,
/// 408/429/5xx/network -> Transient, other 4xx -> ConfigurationError.
ErrorKind error_kind_for_status(long status_code, bool network_error);

/// Result of comparing an existing destination object with its source.
struct UnchangedCheck {
    bool unchanged = false;
    std::optional<uint64_t> source_size;
    std::optional<ErrorKind> error;
    std::string message;
    uint64_t requests = 0;
};

/// Destination matches when it exists and its size equals the source size
/// (expected_size when known, otherwise a HEAD on the source). Never throws.
UnchangedCheck check_unchanged(storage::StorageProvider& provider,
                               const ObjectUri& source,
                               const ObjectUri& destination,
                               std::optional<uint64_t> expected_size);

}  // namespace lakesync
