#pragma once

#include "warden/common/clock.hpp"
#include "warden/common/result.hpp"
#include "warden/storage/state_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace warden::lifecycle {

/// State store key holding a name's deadline in unix milliseconds.
inline constexpr const char *ALARM_KEY = "alarm";

struct AlarmSchedulerConfig {
  std::chrono::milliseconds poll_interval{100};
};

/// One single-shot alarm per controller name. Deadlines are persisted in the state
/// store under the name's scope so a restarted daemon can re-arm them.
class AlarmScheduler {
public:
  using Handler = std::function<void(const std::string &name)>;

  AlarmScheduler(std::shared_ptr<storage::IStateStore> store, std::shared_ptr<common::Clock> clock,
                 AlarmSchedulerConfig config = {});
  ~AlarmScheduler();

  AlarmScheduler(const AlarmScheduler &) = delete;
  AlarmScheduler &operator=(const AlarmScheduler &) = delete;

  void set_handler(Handler handler);

  /// Replaces any pending alarm for `name`.
  [[nodiscard]] common::Status schedule(const std::string &name, std::chrono::milliseconds delay);
  [[nodiscard]] common::Status cancel(const std::string &name);
  /// Loads persisted deadlines; returns how many were re-armed.
  [[nodiscard]] common::Result<std::size_t> restore();

  /// Fires every alarm whose deadline has passed; returns the number fired. The
  /// handler runs without the scheduler lock held and may reschedule.
  std::size_t run_due();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] std::optional<common::TimePoint> deadline(const std::string &name) const;
  [[nodiscard]] std::size_t pending() const;

private:
  void run_loop();

  std::shared_ptr<storage::IStateStore> store_;
  std::shared_ptr<common::Clock> clock_;
  AlarmSchedulerConfig config_;
  Handler handler_;

  mutable std::mutex mutex_;
  std::map<std::string, common::TimePoint> deadlines_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

} // namespace warden::lifecycle
