#pragma once

#include <string>
#include <fmt/format.h>

// Debug log file. Defaults to <temp>/rexec_debug.log until set_log_path().
void set_log_path(const std::string& path);
const std::string& rexec_log_path();

// Append a timestamped line to the debug log. Never fails the caller.
void rexec_log(const std::string& msg);

template <typename... Args>
void rexec_logf(fmt::format_string<Args...> format, Args&&... args) {
    rexec_log(fmt::format(format, std::forward<Args>(args)...));
}
