#include "warden/common/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace warden::common {

namespace {

std::tm to_utc_tm(const TimePoint time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

} // namespace

std::shared_ptr<Clock> system_clock() {
  static const auto clock = std::make_shared<SystemClock>();
  return clock;
}

Sleeper thread_sleeper() {
  return [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::int64_t to_unix_ms(const TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint from_unix_ms(const std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::string format_rfc3339(const TimePoint time) {
  const std::tm tm = to_utc_tm(time);
  const auto millis = to_unix_ms(time) % 1000;
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return out.str();
}

std::string format_date(const TimePoint time) {
  const std::tm tm = to_utc_tm(time);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d");
  return out.str();
}

std::optional<TimePoint> parse_date(const std::string &date) {
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
    return std::nullopt;
  }
  std::tm tm{};
  std::istringstream in(date);
  in >> std::get_time(&tm, "%Y-%m-%d");
  if (in.fail()) {
    return std::nullopt;
  }
  const std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(t);
}

} // namespace warden::common
