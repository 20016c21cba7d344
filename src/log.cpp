// SPDX-License-Identifier: MIT

#include "qrem/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace qrem {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_log_mtx;
}

const char* to_string(LogLevel lvl){
  switch(lvl){
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warning";
    case LogLevel::Error: return "error";
    case LogLevel::Off: return "off";
  }
  return "?";
}

void set_log_level(LogLevel lvl){ g_level.store(static_cast<int>(lvl)); }
LogLevel log_level(){ return static_cast<LogLevel>(g_level.load()); }

std::optional<LogLevel> parse_log_level(const std::string& s){
  if (s=="debug") return LogLevel::Debug;
  if (s=="info") return LogLevel::Info;
  if (s=="warn" || s=="warning") return LogLevel::Warn;
  if (s=="error") return LogLevel::Error;
  if (s=="off" || s=="none") return LogLevel::Off;
  return std::nullopt;
}

void log(LogLevel lvl, const std::string& msg){
  if (lvl == LogLevel::Off || static_cast<int>(lvl) < g_level.load()) return;
  std::lock_guard<std::mutex> lk(g_log_mtx);
  std::cerr << "[qrem] " << to_string(lvl) << ": " << msg << "\n";
}

} // namespace qrem
