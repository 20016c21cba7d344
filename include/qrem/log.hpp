// SPDX-License-Identifier: MIT

#pragma once
#include <optional>
#include <string>

namespace qrem {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Process-wide threshold; messages below it are dropped. Default: Warn.
void set_log_level(LogLevel lvl);
LogLevel log_level();

std::optional<LogLevel> parse_log_level(const std::string& s);
const char* to_string(LogLevel lvl);

// Writes "[qrem] <level>: msg" to std::cerr. Safe to call from worker threads.
void log(LogLevel lvl, const std::string& msg);

inline void log_debug(const std::string& msg){ log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg){ log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg){ log(LogLevel::Warn, msg); }

} // namespace qrem
