#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lakesync::constants {

// SyncConfig defaults and ranges
constexpr int DEFAULT_MAX_CONCURRENT = 10;
constexpr int MIN_MAX_CONCURRENT = 1;
constexpr int MAX_MAX_CONCURRENT = 50;

constexpr int DEFAULT_BATCH_SIZE = 100;
constexpr int MIN_BATCH_SIZE = 1;
constexpr int MAX_BATCH_SIZE = 1000;

constexpr int DEFAULT_RETRY_COUNT = 3;
constexpr int MIN_RETRY_COUNT = 1;
constexpr int MAX_RETRY_COUNT = 10;

// Overall deadline
constexpr size_t MAX_DEADLINE_SECS = 30ULL * 24 * 3600;

// Capability probe
constexpr int DEFAULT_PROBE_TIMEOUT_SECS = 10;
constexpr int MAX_PROBE_TIMEOUT_SECS = 10;

// Chunk (multipart part) sizes
constexpr uint64_t MIB = 1024ULL * 1024;
constexpr uint64_t MIN_CHUNK_SIZE = 5 * MIB;                   // S3 minimum part size
constexpr uint64_t MAX_CHUNK_SIZE = 5ULL * 1024 * MIB;         // S3 maximum part size
constexpr uint64_t SMALL_OBJECT_THRESHOLD = 16 * MIB;
constexpr uint64_t LARGE_OBJECT_THRESHOLD = 512 * MIB;
constexpr uint64_t SMALL_TIER_CHUNK_SIZE = 8 * MIB;
constexpr uint64_t MEDIUM_TIER_CHUNK_SIZE = 50 * MIB;
constexpr uint64_t LARGE_TIER_CHUNK_SIZE = 128 * MIB;

// Retry backoff
constexpr std::chrono::milliseconds RETRY_BASE_DELAY{200};
constexpr std::chrono::milliseconds RETRY_MAX_DELAY{30000};

// Bulk copy tool
constexpr const char* DEFAULT_DIRECT_TOOL = "s5cmd";

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;
constexpr size_t DEFAULT_MULTIPART_CONCURRENCY = 8;

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECS = 15;

} // namespace lakesync::constants
