#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace lakesync {

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool spawn_failed = false;   // fork failed or the executable could not be run
    std::string error_message;

    bool ok() const { return !spawn_failed && !timed_out && exit_code == 0; }
};

/// Run args[0] (looked up on PATH) with the given arguments, capturing
/// stdout and stderr. The child is killed with SIGKILL once timeout expires;
/// a zero timeout waits indefinitely. env entries are added to (or replace
/// entries of) the inherited environment. Never throws.
ProcessResult run_process(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout,
                          const std::map<std::string, std::string>& env = {});

}  // namespace lakesync
