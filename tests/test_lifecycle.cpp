#include "test_framework.hpp"

#include "warden/lifecycle/alarm_scheduler.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace lc = warden::lifecycle;
namespace wt = warden::testing;
using std::chrono::milliseconds;
using std::chrono::seconds;

struct SchedulerFixture {
  std::shared_ptr<wt::MemoryStateStore> store = std::make_shared<wt::MemoryStateStore>();
  std::shared_ptr<wt::ManualClock> clock = std::make_shared<wt::ManualClock>();
  std::vector<std::string> fired;

  std::unique_ptr<lc::AlarmScheduler> make() {
    auto scheduler = std::make_unique<lc::AlarmScheduler>(store, clock);
    scheduler->set_handler([this](const std::string &name) { fired.push_back(name); });
    return scheduler;
  }
};

} // namespace

void register_lifecycle_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;

  tests.push_back({"schedule_persists_deadline", [] {
                     SchedulerFixture fixture;
                     auto scheduler = fixture.make();
                     require(scheduler->schedule("tenant-acme", seconds(10)).ok(), "schedule");
                     const auto stored = fixture.store->values.at({"tenant-acme", "alarm"});
                     require(stored == std::to_string(warden::common::to_unix_ms(wt::fixed_time()) + 10'000),
                             "persisted deadline mismatch: " + stored);
                     require(scheduler->deadline("tenant-acme") == wt::fixed_time() + seconds(10),
                             "in-memory deadline mismatch");
                     require(scheduler->pending() == 1, "one alarm pending");
                   }});

  tests.push_back({"run_due_fires_only_expired_alarms", [] {
                     SchedulerFixture fixture;
                     auto scheduler = fixture.make();
                     require(scheduler->schedule("tenant-a", seconds(5)).ok(), "schedule a");
                     require(scheduler->schedule("tenant-b", seconds(30)).ok(), "schedule b");

                     require(scheduler->run_due() == 0, "nothing due yet");
                     fixture.clock->advance(seconds(5));
                     require(scheduler->run_due() == 1, "one alarm due");
                     require(fixture.fired == std::vector<std::string>{"tenant-a"}, "wrong alarm fired");
                     require(!fixture.store->values.contains({"tenant-a", "alarm"}),
                             "fired alarm should be cleared from storage");
                     require(fixture.store->values.contains({"tenant-b", "alarm"}),
                             "pending alarm should stay persisted");
                     require(scheduler->pending() == 1, "one alarm left");
                   }});

  tests.push_back({"reschedule_replaces_pending_alarm", [] {
                     SchedulerFixture fixture;
                     auto scheduler = fixture.make();
                     require(scheduler->schedule("tenant-acme", seconds(5)).ok(), "first");
                     require(scheduler->schedule("tenant-acme", std::chrono::minutes(30)).ok(), "second");
                     fixture.clock->advance(seconds(6));
                     require(scheduler->run_due() == 0, "earlier deadline should be replaced");
                     require(scheduler->pending() == 1, "only one alarm per name");
                   }});

  tests.push_back({"handler_may_rearm_its_own_alarm", [] {
                     SchedulerFixture fixture;
                     auto scheduler = std::make_unique<lc::AlarmScheduler>(fixture.store, fixture.clock);
                     lc::AlarmScheduler *raw = scheduler.get();
                     int runs = 0;
                     scheduler->set_handler([raw, &runs](const std::string &name) {
                       ++runs;
                       (void)raw->schedule(name, seconds(10));
                     });
                     require(scheduler->schedule("tenant-acme", seconds(1)).ok(), "schedule");
                     fixture.clock->advance(seconds(1));
                     require(scheduler->run_due() == 1, "alarm should fire");
                     require(runs == 1, "handler should run once");
                     require(scheduler->deadline("tenant-acme") == fixture.clock->now() + seconds(10),
                             "handler's re-arm should stick");
                     require(fixture.store->values.contains({"tenant-acme", "alarm"}),
                             "re-armed alarm should be persisted");
                   }});

  tests.push_back({"rearm_during_clear_keeps_new_deadline", [] {
                     SchedulerFixture fixture;
                     auto scheduler = fixture.make();
                     require(scheduler->schedule("tenant-acme", seconds(1)).ok(), "schedule");
                     fixture.clock->advance(seconds(1));
                     fixture.store->before_conditional_remove = [&scheduler]() {
                       (void)scheduler->schedule("tenant-acme", std::chrono::minutes(30));
                     };
                     require(scheduler->run_due() == 1, "alarm should fire");
                     const auto stored = fixture.store->values.find({"tenant-acme", "alarm"});
                     require(stored != fixture.store->values.end(),
                             "deadline armed while clearing should stay persisted");
                     require(stored->second ==
                                 std::to_string(warden::common::to_unix_ms(fixture.clock->now()) +
                                                30 * 60'000),
                             "persisted deadline mismatch: " + stored->second);
                   }});

  tests.push_back({"cancel_removes_alarm", [] {
                     SchedulerFixture fixture;
                     auto scheduler = fixture.make();
                     require(scheduler->schedule("tenant-acme", seconds(1)).ok(), "schedule");
                     require(scheduler->cancel("tenant-acme").ok(), "cancel");
                     fixture.clock->advance(seconds(2));
                     require(scheduler->run_due() == 0, "cancelled alarm should not fire");
                     require(!fixture.store->values.contains({"tenant-acme", "alarm"}),
                             "cancelled alarm should be removed from storage");
                   }});

  tests.push_back({"restore_rearms_persisted_alarms", [] {
                     SchedulerFixture fixture;
                     {
                       auto previous = fixture.make();
                       require(previous->schedule("tenant-a", seconds(5)).ok(), "schedule a");
                       require(previous->schedule("tenant-b", seconds(50)).ok(), "schedule b");
                     }
                     fixture.store->values[{"tenant-c", "alarm"}] = "soon";

                     auto scheduler = fixture.make();
                     const auto restored = scheduler->restore();
                     require(restored.ok(), restored.error());
                     require(restored.value() == 2, "corrupt entries should be skipped");
                     fixture.clock->advance(seconds(10));
                     require(scheduler->run_due() == 1, "overdue alarm should fire after restore");
                     require(fixture.fired == std::vector<std::string>{"tenant-a"}, "wrong alarm fired");
                   }});

  tests.push_back({"background_loop_fires_alarms", [] {
                     SchedulerFixture fixture;
                     std::mutex mutex;
                     std::vector<std::string> fired;
                     auto scheduler = std::make_unique<lc::AlarmScheduler>(
                         fixture.store, fixture.clock,
                         lc::AlarmSchedulerConfig{.poll_interval = milliseconds(100)});
                     scheduler->set_handler([&](const std::string &name) {
                       std::lock_guard<std::mutex> lock(mutex);
                       fired.push_back(name);
                     });
                     require(scheduler->schedule("tenant-acme", milliseconds(0)).ok(), "schedule");
                     scheduler->start();
                     require(scheduler->is_running(), "loop should run");
                     bool seen = false;
                     for (int i = 0; i < 50 && !seen; ++i) {
                       std::this_thread::sleep_for(milliseconds(20));
                       std::lock_guard<std::mutex> lock(mutex);
                       seen = !fired.empty();
                     }
                     scheduler->stop();
                     require(seen, "alarm should fire from the loop");
                     require(!scheduler->is_running(), "loop should stop");
                   }});
}
