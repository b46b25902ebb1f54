#pragma once

#include "mortcalc/core/clock.h"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mortcalc::core {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

[[nodiscard]] std::string_view log_level_to_string(LogLevel level);

// Accepts "debug", "info", "warn"/"warning", "error" (case-sensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

// Abstract logging sink injected into the validation and calculation pipeline.
// Implementations must be safe to call from multiple request threads.
class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void log(LogLevel level, std::string_view message) = 0;

  void debug(std::string_view message) { log(LogLevel::kDebug, message); }
  void info(std::string_view message) { log(LogLevel::kInfo, message); }
  void warn(std::string_view message) { log(LogLevel::kWarn, message); }
  void error(std::string_view message) { log(LogLevel::kError, message); }

 protected:
  ILogger() = default;
  ILogger(const ILogger&) = default;
  ILogger& operator=(const ILogger&) = default;
  ILogger(ILogger&&) = default;
  ILogger& operator=(ILogger&&) = default;
};

// Production sink: "<timestamp> <LEVEL> <message>" lines on stderr.
// Entries below min_level are dropped.
class StderrLogger final : public ILogger {
 public:
  StderrLogger(IClock& clock, LogLevel min_level) : clock_(clock), min_level_(min_level) {}
  ~StderrLogger() override = default;

  // Not copyable or movable (contains mutex)
  StderrLogger(const StderrLogger&) = delete;
  StderrLogger& operator=(const StderrLogger&) = delete;
  StderrLogger(StderrLogger&&) = delete;
  StderrLogger& operator=(StderrLogger&&) = delete;

  void log(LogLevel level, std::string_view message) override;

 private:
  IClock& clock_;
  LogLevel min_level_;
  std::mutex mutex_;
};

struct LogEntry {
  LogLevel level{LogLevel::kInfo};  // NOLINT(readability-identifier-naming)
  std::string message;              // NOLINT(readability-identifier-naming)
};

// Recording sink for tests.
class InMemoryLogger final : public ILogger {
 public:
  InMemoryLogger() = default;
  ~InMemoryLogger() override = default;

  InMemoryLogger(const InMemoryLogger&) = delete;
  InMemoryLogger& operator=(const InMemoryLogger&) = delete;
  InMemoryLogger(InMemoryLogger&&) = delete;
  InMemoryLogger& operator=(InMemoryLogger&&) = delete;

  void log(LogLevel level, std::string_view message) override;

  [[nodiscard]] std::vector<LogEntry> entries() const;
  [[nodiscard]] std::vector<LogEntry> entries_at(LogLevel level) const;

 private:
  mutable std::mutex mutex_;
  std::vector<LogEntry> entries_;
};

}  // namespace mortcalc::core
