#pragma once

#include "lakesync/sync_config.hpp"
#include "lakesync/transfer_types.hpp"

#include <cstdint>
#include <vector>

namespace lakesync {

/// Splits a task list into batches and picks per-batch transfer parameters.
///
/// With BatchStrategy::Sequential, concatenating the tasks of all batches
/// reproduces the input list exactly. Each Batch records the input index of
/// every task it carries.
class BatchPlanner {
public:
    explicit BatchPlanner(const SyncConfig& config);

    std::vector<Batch> plan(const std::vector<TransferTask>& tasks) const;

    /// Same as plan() over a subset of the input, identified by index.
    std::vector<Batch> plan(const std::vector<TransferTask>& tasks,
                            const std::vector<size_t>& indices) const;

    /// Chunk size for a set of tasks: the explicit override when configured,
    /// otherwise the size tier of the average known expected_size.
    uint64_t chunk_size_for(const std::vector<TransferTask>& tasks) const;

    /// Size tier lookup: < 16 MiB -> 8 MiB, < 512 MiB -> 50 MiB, else 128 MiB.
    static uint64_t tiered_chunk_size(uint64_t average_size);

private:
    Batch make_batch(const std::vector<TransferTask>& tasks,
                     std::vector<size_t>::const_iterator first,
                     std::vector<size_t>::const_iterator last) const;

    std::vector<std::vector<size_t>> group_by_prefix(const std::vector<TransferTask>& tasks,
                                                     const std::vector<size_t>& indices) const;

    const SyncConfig& config_;
};

}  // namespace lakesync
