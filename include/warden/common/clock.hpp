#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace warden::common {

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] TimePoint now() const override { return std::chrono::system_clock::now(); }
};

[[nodiscard]] std::shared_ptr<Clock> system_clock();

/// Blocking wait used by retry loops; tests substitute a recorder.
using Sleeper = std::function<void(std::chrono::milliseconds)>;
[[nodiscard]] Sleeper thread_sleeper();

[[nodiscard]] std::int64_t to_unix_ms(TimePoint time);
[[nodiscard]] TimePoint from_unix_ms(std::int64_t ms);

/// 2026-01-31T12:00:00.123Z
[[nodiscard]] std::string format_rfc3339(TimePoint time);
/// 2026-01-31 (UTC calendar date)
[[nodiscard]] std::string format_date(TimePoint time);
[[nodiscard]] std::optional<TimePoint> parse_date(const std::string &date);

} // namespace warden::common
