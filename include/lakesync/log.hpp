#pragma once

namespace lakesync {

/// Enable or disable log_debug output (off by default).
void set_verbose(bool verbose);
bool verbose_enabled();

/// Send info/debug lines to stderr instead of stdout (used when stdout
/// carries the JSON result).
void set_info_to_stderr(bool to_stderr);

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only printed when verbose output is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace lakesync
