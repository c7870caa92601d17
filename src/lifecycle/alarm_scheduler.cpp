#include "warden/lifecycle/alarm_scheduler.hpp"

#include "warden/health/health.hpp"
#include "warden/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <utility>
#include <vector>

namespace warden::lifecycle {

AlarmScheduler::AlarmScheduler(std::shared_ptr<storage::IStateStore> store,
                               std::shared_ptr<common::Clock> clock, AlarmSchedulerConfig config)
    : store_(std::move(store)), clock_(std::move(clock)), config_(config) {}

AlarmScheduler::~AlarmScheduler() { stop(); }

void AlarmScheduler::set_handler(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

common::Status AlarmScheduler::schedule(const std::string &name,
                                        const std::chrono::milliseconds delay) {
  const auto when = clock_->now() + delay;
  if (auto stored = store_->put(name, ALARM_KEY, std::to_string(common::to_unix_ms(when)));
      !stored.ok()) {
    return stored;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  deadlines_[name] = when;
  return common::Status::success();
}

common::Status AlarmScheduler::cancel(const std::string &name) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    deadlines_.erase(name);
  }
  auto removed = store_->remove(name, ALARM_KEY);
  if (!removed.ok()) {
    return common::Status::from(removed.details());
  }
  return common::Status::success();
}

common::Result<std::size_t> AlarmScheduler::restore() {
  auto rows = store_->find_key(ALARM_KEY);
  if (!rows.ok()) {
    return common::Result<std::size_t>::failure(rows.details());
  }
  std::size_t restored = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[scope, value] : rows.value()) {
    std::int64_t ms = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
      observability::record_error("scheduler", "ignoring corrupt alarm for " + scope);
      continue;
    }
    deadlines_[scope] = common::from_unix_ms(ms);
    ++restored;
  }
  return common::Result<std::size_t>::success(restored);
}

std::size_t AlarmScheduler::run_due() {
  std::vector<std::pair<std::string, common::TimePoint>> due;
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();
    for (auto it = deadlines_.begin(); it != deadlines_.end();) {
      if (it->second <= now) {
        due.emplace_back(it->first, it->second);
        it = deadlines_.erase(it);
      } else {
        ++it;
      }
    }
    handler = handler_;
  }

  for (const auto &[name, fired] : due) {
    if (deadline(name).has_value()) {
      // Re-armed by a request after it came due; the persisted value is the new one.
      continue;
    }
    // A schedule() racing this point persists a different deadline, which must survive.
    auto removed =
        store_->remove_if_equals(name, ALARM_KEY, std::to_string(common::to_unix_ms(fired)));
    if (!removed.ok()) {
      observability::record_error("scheduler", "failed to clear alarm for " + name + ": " +
                                                   removed.error());
    }
    if (handler) {
      handler(name);
    }
  }
  return due.size();
}

void AlarmScheduler::start() {
  if (running_) {
    return;
  }
  running_ = true;
  health::mark_component_ok("scheduler");
  thread_ = std::thread([this]() { run_loop(); });
}

void AlarmScheduler::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool AlarmScheduler::is_running() const { return running_; }

void AlarmScheduler::run_loop() {
  while (running_) {
    (void)run_due();
    const auto wait_steps = std::max<long long>(1, config_.poll_interval.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

std::optional<common::TimePoint> AlarmScheduler::deadline(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = deadlines_.find(name);
  if (it == deadlines_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t AlarmScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deadlines_.size();
}

} // namespace warden::lifecycle
