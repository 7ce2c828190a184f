#include "lakesync/mode_selector.hpp"
#include "lakesync/direct_copy_backend.hpp"
#include "lakesync/log.hpp"

#include <algorithm>
#include <exception>

namespace lakesync {

ExecutionMode ModeSelector::select(const std::vector<TransferTask>& tasks,
                                   const SyncConfig& config,
                                   const CapabilityProbe& probe) {
    switch (config.mode) {
        case RequestedMode::Traditional:
            return ExecutionMode::Traditional;
        case RequestedMode::Direct:
            return ExecutionMode::Direct;
        case RequestedMode::Auto:
            break;
    }

    bool all_direct = std::all_of(tasks.begin(), tasks.end(), [](const TransferTask& t) {
        auto uri = ObjectUri::parse(t.source_locator);
        return uri && DirectCopyBackend::supports_source(*uri);
    });
    if (!all_direct) {
        log_debug("Mode: traditional (not every source is server-side copyable)");
        return ExecutionMode::Traditional;
    }
    if (config.destination_container.empty()) {
        log_debug("Mode: traditional (no destination container)");
        return ExecutionMode::Traditional;
    }

    bool available = false;
    if (probe) {
        try {
            available = probe();
        } catch (const std::exception& e) {
            log_warn("Capability probe failed: %s", e.what());
        }
    }
    if (!available) {
        log_info("Direct copy tool '%s' unavailable, using traditional transfers",
                 config.direct_tool.c_str());
        return ExecutionMode::Traditional;
    }
    return ExecutionMode::Direct;
}

}  // namespace lakesync
