#include "warden/observability/global.hpp"

#include <mutex>

namespace warden::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_sandbox(const std::string &sandbox, const std::string &action, const bool success,
                    const std::string &detail) {
  record_event(SandboxEvent{
      .sandbox = sandbox, .action = action, .success = success, .detail = detail});
}

void record_config_inject(const std::string &tenant, const std::string &hash,
                          const std::size_t skills, const bool skipped) {
  record_event(
      ConfigInjectEvent{.tenant = tenant, .hash = hash, .skills = skills, .skipped = skipped});
}

void record_agent_start(const std::string &sandbox, const std::chrono::milliseconds duration,
                        const bool healthy, const std::uint32_t attempts) {
  record_event(AgentStartEvent{
      .sandbox = sandbox, .duration = duration, .healthy = healthy, .attempts = attempts});
}

void record_proxy(const std::string &tenant, const std::string &route, const int status,
                  const bool retried) {
  record_event(ProxyEvent{.tenant = tenant, .route = route, .status = status, .retried = retried});
}

void record_log_flush(const std::string &tenant, const std::size_t entries,
                      const std::string &key) {
  record_event(LogFlushEvent{.tenant = tenant, .entries = entries, .key = key});
}

void record_lifecycle(const std::string &controller, const std::string &action) {
  record_event(LifecycleEvent{.controller = controller, .action = action});
}

void record_notice(const std::string &component, const std::string &message) {
  record_event(NoticeEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace warden::observability
