#include "lakesync/batch_planner.hpp"
#include "lakesync/constants.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <string>
#include <unordered_map>

namespace lakesync {

BatchPlanner::BatchPlanner(const SyncConfig& config)
    : config_(config) {}

uint64_t BatchPlanner::tiered_chunk_size(uint64_t average_size) {
    if (average_size < constants::SMALL_OBJECT_THRESHOLD) return constants::SMALL_TIER_CHUNK_SIZE;
    if (average_size < constants::LARGE_OBJECT_THRESHOLD) return constants::MEDIUM_TIER_CHUNK_SIZE;
    return constants::LARGE_TIER_CHUNK_SIZE;
}

uint64_t BatchPlanner::chunk_size_for(const std::vector<TransferTask>& tasks) const {
    if (config_.chunk_size_bytes != 0) return config_.chunk_size_bytes;

    uint64_t total = 0;
    uint64_t known = 0;
    for (const auto& t : tasks) {
        if (t.expected_size) {
            total += *t.expected_size;
            ++known;
        }
    }
    if (known == 0) return constants::MEDIUM_TIER_CHUNK_SIZE;
    return tiered_chunk_size(total / known);
}

std::vector<Batch> BatchPlanner::plan(const std::vector<TransferTask>& tasks) const {
    std::vector<size_t> indices(tasks.size());
    std::iota(indices.begin(), indices.end(), size_t{0});
    return plan(tasks, indices);
}

std::vector<Batch> BatchPlanner::plan(const std::vector<TransferTask>& tasks,
                                      const std::vector<size_t>& indices) const {
    std::vector<Batch> batches;
    if (indices.empty()) return batches;

    // Batches never span two prefix groups.
    std::vector<std::vector<size_t>> groups;
    if (config_.batch_strategy == BatchStrategy::Prefix) {
        groups = group_by_prefix(tasks, indices);
    } else {
        groups.push_back(indices);
    }

    auto step = static_cast<std::ptrdiff_t>(std::max(config_.batch_size, 1));
    for (const auto& group : groups) {
        for (auto first = group.cbegin(); first != group.cend();) {
            auto last = first + std::min(step, group.cend() - first);
            batches.push_back(make_batch(tasks, first, last));
            first = last;
        }
    }
    return batches;
}

Batch BatchPlanner::make_batch(const std::vector<TransferTask>& tasks,
                               std::vector<size_t>::const_iterator first,
                               std::vector<size_t>::const_iterator last) const {
    Batch batch;
    batch.indices.assign(first, last);
    batch.tasks.reserve(batch.indices.size());
    for (size_t idx : batch.indices) {
        batch.tasks.push_back(tasks[idx]);
    }
    batch.shared_parameters.chunk_size_bytes = chunk_size_for(batch.tasks);
    batch.shared_parameters.skip_if_unchanged = config_.incremental;
    return batch;
}

std::vector<std::vector<size_t>> BatchPlanner::group_by_prefix(
    const std::vector<TransferTask>& tasks, const std::vector<size_t>& indices) const {
    // Groups in order of first appearance, input order inside a group.
    std::vector<std::vector<size_t>> groups;
    std::unordered_map<std::string, size_t> group_index;
    for (size_t idx : indices) {
        auto uri = ObjectUri::parse(tasks[idx].source_locator);
        std::string key = uri ? uri->container + "/" + uri->key_prefix() : std::string();
        auto [it, inserted] = group_index.emplace(key, groups.size());
        if (inserted) groups.emplace_back();
        groups[it->second].push_back(idx);
    }
    return groups;
}

}  // namespace lakesync
