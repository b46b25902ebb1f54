#pragma once

#include <string>
#include <utility>

namespace mortcalc::core {

// Timestamp source for log lines. Injected so tests can pin the prefix.
class IClock {
 public:
  virtual ~IClock() = default;

  // UTC, ISO 8601. Never empty.
  virtual std::string now_iso8601() = 0;
};

// Wall clock with millisecond resolution, e.g. "2026-03-01T12:00:00.250Z".
class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override { return fixed_time_; }

 private:
  std::string fixed_time_;
};

}  // namespace mortcalc::core
