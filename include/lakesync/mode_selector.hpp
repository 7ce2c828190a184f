#pragma once

#include "lakesync/sync_config.hpp"
#include "lakesync/transfer_types.hpp"

#include <functional>
#include <vector>

namespace lakesync {

/// Returns true when the direct backend is installed and reachable.
using CapabilityProbe = std::function<bool()>;

/// Picks the execution mode once per sync. First match wins:
///   mode == traditional -> Traditional
///   mode == direct      -> Direct (caller handles an unavailable backend)
///   auto                -> Direct iff every source is s3://, a destination
///                          container is set and the probe succeeds
/// The probe runs only when the other auto conditions hold. Never throws.
class ModeSelector {
public:
    static ExecutionMode select(const std::vector<TransferTask>& tasks,
                                const SyncConfig& config,
                                const CapabilityProbe& probe);
};

}  // namespace lakesync
