#include "lakesync/direct_copy_backend.hpp"
#include "lakesync/log.hpp"
#include "lakesync/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace lakesync {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ErrorKind classify_tool_error(const std::string& message) {
    std::string m = to_lower(message);
    if (m.find("accessdenied") != std::string::npos ||
        m.find("access denied") != std::string::npos ||
        m.find("forbidden") != std::string::npos) {
        return ErrorKind::PermissionDenied;
    }
    if (m.find("nosuchkey") != std::string::npos ||
        m.find("nosuchbucket") != std::string::npos ||
        m.find("not found") != std::string::npos) {
        return ErrorKind::NotFound;
    }
    return ErrorKind::Transient;
}

// Last line of the tool's stderr, for failure messages
std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of("\r\n");
    if (end == std::string::npos) return "";
    auto start = text.rfind('\n', end);
    start = start == std::string::npos ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

}  // namespace

// ============================================================================
// Command list
// ============================================================================

std::string quote_argument(const std::string& s) {
    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> split_command_line(const std::string& line) {
    std::vector<std::string> words;
    std::string word;
    bool in_word = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == ' ' || c == '\t') {
            if (in_word) {
                words.push_back(std::move(word));
                word.clear();
                in_word = false;
            }
        } else if (c == '\'') {
            in_word = true;
            auto close = line.find('\'', i + 1);
            if (close == std::string::npos) close = line.size();
            word.append(line, i + 1, close - i - 1);
            i = close;
        } else if (c == '"') {
            in_word = true;
            for (++i; i < line.size() && line[i] != '"'; ++i) {
                if (line[i] == '\\' && i + 1 < line.size() &&
                    (line[i + 1] == '"' || line[i + 1] == '\\' || line[i + 1] == '$' || line[i + 1] == '`')) {
                    ++i;
                }
                word += line[i];
            }
        } else if (c == '\\' && i + 1 < line.size()) {
            in_word = true;
            word += line[++i];
        } else {
            in_word = true;
            word += c;
        }
    }
    if (in_word) words.push_back(std::move(word));
    return words;
}

std::string CopyDescriptor::to_command_line() const {
    if (mode == SyncMode::Sync) {
        return "sync --delete --exact-timestamps " + quote_argument(source) + " " +
               quote_argument(destination);
    }

    uint64_t chunk = chunk_size_bytes != 0 ? chunk_size_bytes : constants::MEDIUM_TIER_CHUNK_SIZE;
    uint64_t part_mib = std::max<uint64_t>((chunk + constants::MIB - 1) / constants::MIB,
                                           constants::MIN_CHUNK_SIZE / constants::MIB);

    std::ostringstream line;
    line << "cp";
    if (!overwrite_if_unchanged) {
        line << " --if-size-differ";
    }
    if (!source_region_hint.empty()) {
        line << " --source-region " << source_region_hint;
    }
    line << " --part-size " << part_mib;
    line << " " << quote_argument(source) << " " << quote_argument(destination);
    return line.str();
}

std::string render_command_list(const std::vector<CopyDescriptor>& descriptors) {
    std::string out;
    for (const auto& d : descriptors) {
        out += d.to_command_line();
        out += '\n';
    }
    return out;
}

// ============================================================================
// DirectCopyBackend
// ============================================================================

DirectCopyOptions DirectCopyOptions::from_config(const SyncConfig& config) {
    DirectCopyOptions options;
    options.destination_container = config.destination_container;
    options.destination_prefix = config.destination_prefix;
    options.tool = config.direct_tool;
    options.num_workers = config.max_concurrent;
    options.retry_count = config.retry_count;
    options.sync_mode = config.sync_mode;
    options.source_region_hint = config.source_region_hint;
    options.no_sign_request = config.no_sign_request;

    auto get = [&config](const char* key) -> std::string {
        auto it = config.storage.find(key);
        return it != config.storage.end() ? it->second : "";
    };

    options.endpoint = get("endpoint");
    std::string verify = get("verify_ssl");
    options.verify_ssl = !(verify == "false" || verify == "0");

    if (!get("access_key").empty()) options.env["AWS_ACCESS_KEY_ID"] = get("access_key");
    if (!get("secret_key").empty()) options.env["AWS_SECRET_ACCESS_KEY"] = get("secret_key");
    if (!get("session_token").empty()) options.env["AWS_SESSION_TOKEN"] = get("session_token");
    if (!get("region").empty()) options.env["AWS_REGION"] = get("region");
    return options;
}

DirectCopyBackend::DirectCopyBackend(DirectCopyOptions options,
                                     std::shared_ptr<storage::StorageProvider> provider)
    : options_(std::move(options))
    , provider_(std::move(provider)) {}

bool DirectCopyBackend::probe(std::chrono::seconds timeout) {
    auto result = run_process({options_.tool, "version"},
                              std::chrono::duration_cast<std::chrono::milliseconds>(timeout),
                              options_.env);
    if (!result.ok()) {
        log_debug("Probe: %s unavailable (%s)", options_.tool.c_str(),
                  result.error_message.empty() ? ("exit " + std::to_string(result.exit_code)).c_str()
                                               : result.error_message.c_str());
        return false;
    }
    log_debug("Probe: %s %s", options_.tool.c_str(), last_line(result.stdout_data).c_str());
    return true;
}

std::vector<std::string> DirectCopyBackend::global_flags(int tool_retries) const {
    std::vector<std::string> cmd = {options_.tool, "--json"};
    if (options_.no_sign_request) {
        cmd.push_back("--no-sign-request");
    }
    if (!options_.endpoint.empty()) {
        cmd.push_back("--endpoint-url");
        cmd.push_back(options_.endpoint);
    }
    if (!options_.verify_ssl) {
        cmd.push_back("--no-verify-ssl");
    }
    cmd.push_back("--numworkers");
    cmd.push_back(std::to_string(std::max(options_.num_workers, 1)));
    cmd.push_back("--retry-count");
    cmd.push_back(std::to_string(std::max(tool_retries, 0)));
    return cmd;
}

std::vector<std::string> DirectCopyBackend::base_command() const {
    // Batch retries are owned by the coordinator
    auto cmd = global_flags(0);
    cmd.push_back("run");
    return cmd;
}

std::vector<std::string> DirectCopyBackend::directory_sync_command(
    const std::string& source_prefix,
    const std::string& target_prefix,
    const std::vector<std::string>& include_patterns,
    const std::vector<std::string>& exclude_patterns) const {
    auto cmd = global_flags(options_.retry_count - 1);
    cmd.push_back("sync");
    for (const auto& p : include_patterns) {
        cmd.push_back("--include");
        cmd.push_back(p);
    }
    for (const auto& p : exclude_patterns) {
        cmd.push_back("--exclude");
        cmd.push_back(p);
    }
    if (options_.sync_mode == SyncMode::Sync) {
        cmd.push_back("--delete");
    }
    cmd.push_back(source_prefix);
    cmd.push_back(target_prefix);
    return cmd;
}

DirectorySyncResult DirectCopyBackend::sync_directory(const std::string& source_prefix,
                                                      const std::string& target_prefix,
                                                      const std::vector<std::string>& include_patterns,
                                                      const std::vector<std::string>& exclude_patterns,
                                                      std::chrono::steady_clock::time_point deadline) {
    DirectorySyncResult result;
    result.source_prefix = source_prefix;
    result.target_prefix = target_prefix;

    std::chrono::milliseconds timeout{0};
    if (deadline != std::chrono::steady_clock::time_point::max()) {
        timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (timeout.count() <= 0) {
            result.error_message = "deadline exceeded before sync started";
            return result;
        }
    }

    log_info("Direct: syncing %s -> %s (%s)", source_prefix.c_str(), target_prefix.c_str(),
             to_string(options_.sync_mode));
    auto proc = run_process(
        directory_sync_command(source_prefix, target_prefix, include_patterns, exclude_patterns),
        timeout, options_.env);

    result.exit_code = proc.exit_code;
    result.stdout_data = std::move(proc.stdout_data);
    result.stderr_data = std::move(proc.stderr_data);
    result.success = proc.ok();
    if (!result.success) {
        std::string detail = last_line(result.stderr_data);
        result.error_message = !proc.error_message.empty()
            ? proc.error_message
            : "exit " + std::to_string(proc.exit_code) + (detail.empty() ? "" : ": " + detail);
    }

    for (const auto* output : {&result.stdout_data, &result.stderr_data}) {
        std::istringstream stream(*output);
        std::string line;
        while (std::getline(stream, line)) {
            if (line.empty() || line.front() != '{') continue;
            auto j = nlohmann::json::parse(line, nullptr, false);
            if (j.is_discarded() || !j.is_object()) continue;
            if (j.contains("error")) {
                ++result.objects_failed;
            } else if (j.value("success", false)) {
                ++result.objects_copied;
            }
        }
    }

    log_info("Direct: sync %s -> %s %s: %llu copied, %llu failed", source_prefix.c_str(),
             target_prefix.c_str(), result.success ? "finished" : "failed",
             static_cast<unsigned long long>(result.objects_copied),
             static_cast<unsigned long long>(result.objects_failed));
    return result;
}

std::filesystem::path DirectCopyBackend::write_command_file(const std::string& contents) const {
    std::filesystem::path dir = options_.work_dir.empty()
        ? std::filesystem::temp_directory_path() : options_.work_dir;
    std::string tmpl = (dir / "lakesync-batch-XXXXXX").string();

    int fd = mkstemp(tmpl.data());
    if (fd < 0) {
        throw std::runtime_error("mkstemp failed in " + dir.string() + ": " + strerror(errno));
    }

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = write(fd, contents.data() + written, contents.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            int err = errno;
            close(fd);
            unlink(tmpl.c_str());
            throw std::runtime_error("Failed to write command list: " + std::string(strerror(err)));
        }
        written += static_cast<size_t>(n);
    }
    close(fd);
    return tmpl;
}

BatchResult DirectCopyBackend::execute(const Batch& batch,
                                       std::chrono::steady_clock::time_point deadline) {
    BatchResult result;
    result.outcomes.resize(batch.size());
    std::vector<bool> resolved(batch.size(), false);

    auto resolve = [&](size_t i, TransferOutcome outcome) {
        result.outcomes[i] = std::move(outcome);
        resolved[i] = true;
    };

    // Build descriptors, answering unchanged objects locally
    std::vector<CopyDescriptor> descriptors;
    std::vector<size_t> positions;  // descriptor -> position in batch

    for (size_t i = 0; i < batch.size(); ++i) {
        const auto& task = batch.tasks[i];
        auto source = ObjectUri::parse(task.source_locator);
        if (!source || !supports_source(*source)) {
            resolve(i, TransferOutcome::failed(task, ErrorKind::ConfigurationError,
                                               "unsupported source for direct copy: " + task.source_locator));
            continue;
        }
        if (!is_safe_relative_path(task.destination_relative_path)) {
            resolve(i, TransferOutcome::failed(task, ErrorKind::ConfigurationError,
                                               "destination path escapes prefix: " + task.destination_relative_path));
            continue;
        }

        ObjectUri destination{"s3", options_.destination_container,
                              join_key(options_.destination_prefix, task.destination_relative_path)};

        if (batch.shared_parameters.skip_if_unchanged && provider_) {
            auto check = check_unchanged(*provider_, *source, destination, task.expected_size);
            result.operations_issued += check.requests;
            if (check.error) {
                resolve(i, TransferOutcome::failed(task, *check.error, check.message));
                continue;
            }
            if (check.unchanged) {
                resolve(i, TransferOutcome::skipped(task));
                continue;
            }
        }

        CopyDescriptor d;
        d.source = source->to_string();
        d.destination = destination.to_string();
        d.overwrite_if_unchanged = !batch.shared_parameters.skip_if_unchanged;
        d.source_region_hint = options_.source_region_hint;
        d.chunk_size_bytes = batch.shared_parameters.chunk_size_bytes;
        d.mode = options_.sync_mode;
        descriptors.push_back(std::move(d));
        positions.push_back(i);
    }

    if (descriptors.empty()) {
        return result;
    }

    auto fail_remaining = [&](ErrorKind kind, const std::string& message) {
        for (size_t p : positions) {
            if (!resolved[p]) {
                resolve(p, TransferOutcome::failed(batch.tasks[p], kind, message));
            }
        }
    };

    std::chrono::milliseconds timeout{0};
    if (deadline != std::chrono::steady_clock::time_point::max()) {
        timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (timeout.count() <= 0) {
            fail_remaining(ErrorKind::Cancelled, "deadline exceeded before copy started");
            return result;
        }
    }

    std::filesystem::path command_file;
    try {
        command_file = write_command_file(render_command_list(descriptors));
    } catch (const std::exception& e) {
        fail_remaining(ErrorKind::Transient, e.what());
        return result;
    }

    auto cmd = base_command();
    cmd.push_back(command_file.string());
    log_debug("Direct: running %s with %zu copies", options_.tool.c_str(), descriptors.size());

    auto proc = run_process(cmd, timeout, options_.env);

    std::error_code ec;
    std::filesystem::remove(command_file, ec);

    if (proc.spawn_failed) {
        fail_remaining(ErrorKind::CapabilityUnavailable, proc.error_message);
        return result;
    }

    result.operations_issued += descriptors.size();
    apply_tool_output(proc.stdout_data, batch, descriptors, positions, result, resolved);
    apply_tool_output(proc.stderr_data, batch, descriptors, positions, result, resolved);

    for (size_t d = 0; d < descriptors.size(); ++d) {
        size_t p = positions[d];
        if (resolved[p]) continue;

        if (proc.timed_out) {
            resolve(p, TransferOutcome::failed(batch.tasks[p], ErrorKind::Transient, proc.error_message));
        } else if (proc.exit_code == 0 && (!descriptors[d].overwrite_if_unchanged ||
                                           descriptors[d].mode == SyncMode::Sync)) {
            // Copies the tool found unnecessary produce no line
            resolve(p, TransferOutcome::skipped(batch.tasks[p]));
        } else {
            std::string detail = last_line(proc.stderr_data);
            resolve(p, TransferOutcome::failed(batch.tasks[p], ErrorKind::Transient,
                "no result reported by " + options_.tool + " (exit " + std::to_string(proc.exit_code) + ")" +
                (detail.empty() ? "" : ": " + detail)));
        }
    }

    return result;
}

void DirectCopyBackend::apply_tool_output(const std::string& output,
                                          const Batch& batch,
                                          const std::vector<CopyDescriptor>& descriptors,
                                          const std::vector<size_t>& positions,
                                          BatchResult& result,
                                          std::vector<bool>& resolved) const {
    // First unresolved descriptor whose source and destination equal the
    // line's. Error lines only carry the command; its last two words are the
    // operands.
    auto find = [&](std::string source, std::string destination,
                    const std::string& command) -> std::optional<size_t> {
        if (source.empty() && destination.empty()) {
            auto words = split_command_line(command);
            if (words.size() < 3) return std::nullopt;
            source = words[words.size() - 2];
            destination = words.back();
        }
        for (size_t d = 0; d < descriptors.size(); ++d) {
            if (resolved[positions[d]]) continue;
            if (descriptors[d].source == source && descriptors[d].destination == destination) return d;
        }
        return std::nullopt;
    };

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty() || line.front() != '{') continue;

        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;

        std::string source = j.value("source", "");
        std::string destination = j.value("destination", "");
        std::string command = j.value("command", "");

        auto d = find(source, destination, command);
        if (!d) {
            log_debug("Direct: unmatched tool output: %s", line.c_str());
            continue;
        }

        size_t p = positions[*d];

        if (j.contains("error")) {
            std::string message = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
            result.outcomes[p] = TransferOutcome::failed(
                batch.tasks[p], classify_tool_error(message), message);
        } else if (j.value("success", false)) {
            std::optional<uint64_t> size;
            if (j.contains("object") && j["object"].is_object() && j["object"].contains("size") &&
                j["object"]["size"].is_number_unsigned()) {
                size = j["object"]["size"].get<uint64_t>();
            }
            result.outcomes[p] = TransferOutcome::succeeded(batch.tasks[p], size);
        } else {
            continue;
        }
        resolved[p] = true;
    }
}

}  // namespace lakesync
