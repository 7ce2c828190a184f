#include "lakesync/sync_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lakesync {

const char* to_string(BatchStrategy strategy) {
    switch (strategy) {
        case BatchStrategy::Sequential: return "sequential";
        case BatchStrategy::Prefix: return "prefix";
    }
    return "sequential";
}

std::optional<BatchStrategy> parse_batch_strategy(const std::string& s) {
    if (s == "sequential") return BatchStrategy::Sequential;
    if (s == "prefix") return BatchStrategy::Prefix;
    return std::nullopt;
}

const char* to_string(SyncMode mode) {
    switch (mode) {
        case SyncMode::Copy: return "copy";
        case SyncMode::Sync: return "sync";
    }
    return "copy";
}

std::optional<SyncMode> parse_sync_mode(const std::string& s) {
    if (s == "copy") return SyncMode::Copy;
    if (s == "sync") return SyncMode::Sync;
    return std::nullopt;
}

namespace {

// Whole-string decimal that fits T. Signs, blanks and trailing text are rejected.
template <typename T>
bool parse_unsigned(const std::string& text, T& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        size_t used = 0;
        unsigned long long value = std::stoull(text, &used);
        if (used != text.size() ||
            value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            return false;
        }
        out = static_cast<T>(value);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// Non-negative JSON integer that fits T; throws std::runtime_error otherwise.
template <typename T>
void read_json_unsigned(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!v.is_number_unsigned() ||
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw std::runtime_error(std::string(key) + " must be a non-negative integer, got " + v.dump());
    }
    out = static_cast<T>(v.get<uint64_t>());
}

bool is_s3_prefix(const std::string& s) {
    return s.rfind("s3://", 0) == 0 && s.size() > 5 && s[5] != '/';
}

// Map --endpoint / --access-key / ... to storage params.
// Returns true if the flag was a storage flag.
bool parse_storage_flag(const std::string& arg, const char* value,
                        std::map<std::string, std::string>& storage) {
    if (arg == "--endpoint") {
        storage["endpoint"] = value;
    } else if (arg == "--region") {
        storage["region"] = value;
    } else if (arg == "--access-key") {
        storage["access_key"] = value;
    } else if (arg == "--secret-key") {
        storage["secret_key"] = value;
    } else if (arg == "--session-token") {
        storage["session_token"] = value;
    } else {
        return false;
    }
    return true;
}

bool is_storage_flag(const std::string& arg) {
    return arg == "--endpoint" || arg == "--region" || arg == "--access-key" ||
           arg == "--secret-key" || arg == "--session-token";
}

void print_usage() {
    std::cerr <<
        "Usage: lakesync --tasks <file.json> --destination-container <bucket> [options]\n"
        "\n"
        "Required:\n"
        "  --tasks <path>                   JSON array of {\"source\", \"destination\", \"size\"}\n"
        "  --destination-container <name>   Destination bucket\n"
        "\n"
        "Transfer:\n"
        "  --destination-prefix <prefix>    Key prefix under the destination bucket\n"
        "  --mode <auto|direct|traditional> Execution mode (default: auto)\n"
        "  --max-concurrent <N>             Batches in flight, 1-50 (default: 10)\n"
        "  --batch-size <N>                 Tasks per batch, 1-1000 (default: 100)\n"
        "  --chunk-size <bytes>             Multipart chunk size, 5MiB-5GiB (default: size-tiered)\n"
        "  --retry-count <N>                Attempts per task, 1-10 (default: 3)\n"
        "  --no-incremental                 Copy even when the destination already matches\n"
        "  --batch-strategy <s>             sequential or prefix (default: sequential)\n"
        "  --deadline <secs>                Cancel remaining work after this many seconds (max 30 days)\n"
        "\n"
        "Bulk copy tool:\n"
        "  --direct-tool <path>             Executable (default: s5cmd)\n"
        "  --source-region <region>         Source bucket region hint\n"
        "  --no-sign-request                Read public source buckets anonymously\n"
        "  --probe-timeout <secs>           Capability probe timeout, 1-10 (default: 10)\n"
        "  --sync-mode <copy|sync>          cp --if-size-differ, or sync --delete (default: copy)\n"
        "\n"
        "Directory sync (instead of --tasks):\n"
        "  --sync-source <s3://b/prefix/>   Source prefix\n"
        "  --sync-target <s3://b/prefix/>   Target prefix\n"
        "  --include <pattern>              Only sync matching keys (repeatable)\n"
        "  --exclude <pattern>              Skip matching keys (repeatable)\n"
        "\n"
        "Storage:\n"
        "  --endpoint <url>                 S3 endpoint (or S3_ENDPOINT_URL env)\n"
        "  --region <region>                Region (or AWS_REGION env, default: us-east-1)\n"
        "  --access-key <key>               Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --secret-key <key>               Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --session-token <token>          Session token (or AWS_SESSION_TOKEN env)\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --path-style                     Use path-style bucket addressing\n"
        "\n"
        "Other:\n"
        "  --config <path>                  JSON config file\n"
        "  --output <path>                  Write the JSON result here (default: stdout)\n"
        "  --verbose                        Verbose output\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

std::string json_param_string(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

}  // namespace

std::optional<SyncConfig> SyncConfig::from_args(int argc, char* argv[]) {
    SyncConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto next_number = [&](int& i, const char* name, auto& out) -> bool {
        auto* v = next_arg(i, name);
        if (!v) return false;
        if (!parse_unsigned(v, out)) {
            std::cerr << "Error: " << name << " must be a non-negative integer, got '" << v << "'\n";
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (is_storage_flag(arg)) {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            if (!parse_storage_flag(arg, v, config.storage)) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--tasks") {
            auto* v = next_arg(i, "--tasks");
            if (!v) return std::nullopt;
            config.tasks_file = v;
        } else if (arg == "--output") {
            auto* v = next_arg(i, "--output");
            if (!v) return std::nullopt;
            config.output_file = v;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--destination-container") {
            auto* v = next_arg(i, "--destination-container");
            if (!v) return std::nullopt;
            config.destination_container = v;
        } else if (arg == "--destination-prefix") {
            auto* v = next_arg(i, "--destination-prefix");
            if (!v) return std::nullopt;
            config.destination_prefix = v;
        } else if (arg == "--mode") {
            auto* v = next_arg(i, "--mode");
            if (!v) return std::nullopt;
            auto mode = parse_requested_mode(v);
            if (!mode) {
                std::cerr << "Error: invalid --mode: " << v << "\n";
                return std::nullopt;
            }
            config.mode = *mode;
        } else if (arg == "--max-concurrent") {
            if (!next_number(i, "--max-concurrent", config.max_concurrent)) return std::nullopt;
        } else if (arg == "--batch-size") {
            if (!next_number(i, "--batch-size", config.batch_size)) return std::nullopt;
        } else if (arg == "--chunk-size") {
            if (!next_number(i, "--chunk-size", config.chunk_size_bytes)) return std::nullopt;
        } else if (arg == "--retry-count") {
            if (!next_number(i, "--retry-count", config.retry_count)) return std::nullopt;
        } else if (arg == "--no-incremental") {
            config.incremental = false;
        } else if (arg == "--batch-strategy") {
            auto* v = next_arg(i, "--batch-strategy");
            if (!v) return std::nullopt;
            auto strategy = parse_batch_strategy(v);
            if (!strategy) {
                std::cerr << "Error: invalid --batch-strategy: " << v << "\n";
                return std::nullopt;
            }
            config.batch_strategy = *strategy;
        } else if (arg == "--deadline") {
            if (!next_number(i, "--deadline", config.deadline_secs)) return std::nullopt;
        } else if (arg == "--direct-tool") {
            auto* v = next_arg(i, "--direct-tool");
            if (!v) return std::nullopt;
            config.direct_tool = v;
        } else if (arg == "--source-region") {
            auto* v = next_arg(i, "--source-region");
            if (!v) return std::nullopt;
            config.source_region_hint = v;
        } else if (arg == "--no-sign-request") {
            config.no_sign_request = true;
        } else if (arg == "--sync-mode") {
            auto* v = next_arg(i, "--sync-mode");
            if (!v) return std::nullopt;
            auto mode = parse_sync_mode(v);
            if (!mode) {
                std::cerr << "Error: invalid --sync-mode: " << v << " (expected copy or sync)\n";
                return std::nullopt;
            }
            config.sync_mode = *mode;
        } else if (arg == "--sync-source") {
            auto* v = next_arg(i, "--sync-source");
            if (!v) return std::nullopt;
            config.sync_source_prefix = v;
        } else if (arg == "--sync-target") {
            auto* v = next_arg(i, "--sync-target");
            if (!v) return std::nullopt;
            config.sync_target_prefix = v;
        } else if (arg == "--include") {
            auto* v = next_arg(i, "--include");
            if (!v) return std::nullopt;
            config.include_patterns.push_back(v);
        } else if (arg == "--exclude") {
            auto* v = next_arg(i, "--exclude");
            if (!v) return std::nullopt;
            config.exclude_patterns.push_back(v);
        } else if (arg == "--probe-timeout") {
            if (!next_number(i, "--probe-timeout", config.probe_timeout_secs)) return std::nullopt;
        } else if (arg == "--no-verify-ssl") {
            config.storage["verify_ssl"] = "false";
        } else if (arg == "--path-style") {
            config.storage["path_style"] = "true";
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            if (!next_number(i, "--metrics-interval", config.metrics_interval_secs)) return std::nullopt;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool SyncConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("destination_container"))
            destination_container = j["destination_container"].get<std::string>();
        if (j.contains("destination_prefix"))
            destination_prefix = j["destination_prefix"].get<std::string>();
        read_json_unsigned(j, "max_concurrent", max_concurrent);
        read_json_unsigned(j, "batch_size", batch_size);
        read_json_unsigned(j, "chunk_size_bytes", chunk_size_bytes);
        read_json_unsigned(j, "retry_count", retry_count);
        if (j.contains("incremental")) incremental = j["incremental"].get<bool>();
        if (j.contains("mode")) {
            auto s = j["mode"].get<std::string>();
            auto parsed = parse_requested_mode(s);
            if (!parsed) {
                std::cerr << "Error: invalid mode in config: " << s << "\n";
                return false;
            }
            mode = *parsed;
        }
        if (j.contains("batch_strategy")) {
            auto s = j["batch_strategy"].get<std::string>();
            auto parsed = parse_batch_strategy(s);
            if (!parsed) {
                std::cerr << "Error: invalid batch_strategy in config: " << s << "\n";
                return false;
            }
            batch_strategy = *parsed;
        }
        if (j.contains("direct_tool")) direct_tool = j["direct_tool"].get<std::string>();
        if (j.contains("source_region_hint"))
            source_region_hint = j["source_region_hint"].get<std::string>();
        if (j.contains("no_sign_request")) no_sign_request = j["no_sign_request"].get<bool>();
        if (j.contains("sync_mode")) {
            auto s = j["sync_mode"].get<std::string>();
            auto parsed = parse_sync_mode(s);
            if (!parsed) {
                std::cerr << "Error: invalid sync_mode in config: " << s << " (expected copy or sync)\n";
                return false;
            }
            sync_mode = *parsed;
        }
        if (j.contains("sync_source_prefix"))
            sync_source_prefix = j["sync_source_prefix"].get<std::string>();
        if (j.contains("sync_target_prefix"))
            sync_target_prefix = j["sync_target_prefix"].get<std::string>();
        if (j.contains("include_patterns"))
            include_patterns = j["include_patterns"].get<std::vector<std::string>>();
        if (j.contains("exclude_patterns"))
            exclude_patterns = j["exclude_patterns"].get<std::vector<std::string>>();
        read_json_unsigned(j, "probe_timeout_secs", probe_timeout_secs);
        read_json_unsigned(j, "deadline_secs", deadline_secs);
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        read_json_unsigned(j, "metrics_interval", metrics_interval_secs);

        if (j.contains("storage") && j["storage"].is_object()) {
            for (auto& [key, val] : j["storage"].items()) {
                storage[key] = json_param_string(val);
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void SyncConfig::apply_defaults() {
    auto from_env = [&](const char* key, const char* env) {
        if (storage.count(key) == 0 || storage[key].empty()) {
            if (const char* v = std::getenv(env)) {
                storage[key] = v;
            }
        }
    };
    from_env("access_key", "AWS_ACCESS_KEY_ID");
    from_env("secret_key", "AWS_SECRET_ACCESS_KEY");
    from_env("session_token", "AWS_SESSION_TOKEN");
    from_env("region", "AWS_REGION");
    from_env("endpoint", "S3_ENDPOINT_URL");
}

std::string SyncConfig::validate() const {
    if (sync_source_prefix.empty() != sync_target_prefix.empty())
        return "sync_source_prefix and sync_target_prefix must be set together";
    if (directory_sync() && (!is_s3_prefix(sync_source_prefix) || !is_s3_prefix(sync_target_prefix)))
        return "directory sync prefixes must be s3://bucket/... locators";
    if (destination_container.empty() && !directory_sync())
        return "destination_container is required (--destination-container)";
    if (destination_container.find('/') != std::string::npos)
        return "destination_container must be a bucket name, not a path: " + destination_container;
    if (!destination_prefix.empty() && !is_safe_relative_path(destination_prefix))
        return "destination_prefix must not contain '..': " + destination_prefix;
    if (max_concurrent < constants::MIN_MAX_CONCURRENT || max_concurrent > constants::MAX_MAX_CONCURRENT)
        return "max_concurrent must be in [1, 50], got " + std::to_string(max_concurrent);
    if (batch_size < constants::MIN_BATCH_SIZE || batch_size > constants::MAX_BATCH_SIZE)
        return "batch_size must be in [1, 1000], got " + std::to_string(batch_size);
    if (retry_count < constants::MIN_RETRY_COUNT || retry_count > constants::MAX_RETRY_COUNT)
        return "retry_count must be in [1, 10], got " + std::to_string(retry_count);
    if (chunk_size_bytes != 0 &&
        (chunk_size_bytes < constants::MIN_CHUNK_SIZE || chunk_size_bytes > constants::MAX_CHUNK_SIZE))
        return "chunk_size_bytes must be 0 or in [5 MiB, 5 GiB], got " + std::to_string(chunk_size_bytes);
    if (probe_timeout_secs < 1 || probe_timeout_secs > constants::MAX_PROBE_TIMEOUT_SECS)
        return "probe_timeout_secs must be in [1, 10], got " + std::to_string(probe_timeout_secs);
    if (deadline_secs > constants::MAX_DEADLINE_SECS)
        return "deadline_secs must be at most " + std::to_string(constants::MAX_DEADLINE_SECS) +
               " (30 days), got " + std::to_string(deadline_secs);
    if (direct_tool.empty()) return "direct_tool must not be empty";
    if (!metrics_file.empty() && metrics_interval_secs == 0)
        return "metrics_interval must be > 0";
    return {};
}

}  // namespace lakesync
