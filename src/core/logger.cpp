#include "mortcalc/core/logger.h"

#include <iostream>

namespace mortcalc::core {

std::string_view log_level_to_string(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

void StderrLogger::log(LogLevel level, std::string_view message) {
  if (level < min_level_) {
    return;
  }

  const std::string timestamp = clock_.now_iso8601();

  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << timestamp << ' ' << log_level_to_string(level) << ' ' << message << '\n';
}

void InMemoryLogger::log(LogLevel level, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(LogEntry{level, std::string{message}});
}

std::vector<LogEntry> InMemoryLogger::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::vector<LogEntry> InMemoryLogger::entries_at(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LogEntry> filtered;
  for (const auto& entry : entries_) {
    if (entry.level == level) {
      filtered.push_back(entry);
    }
  }
  return filtered;
}

}  // namespace mortcalc::core
