#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace warden::observability {

struct SandboxEvent {
  std::string sandbox;
  std::string action;
  bool success = true;
  std::string detail;
};

struct ConfigInjectEvent {
  std::string tenant;
  std::string hash;
  std::size_t skills = 0;
  bool skipped = false;
};

struct AgentStartEvent {
  std::string sandbox;
  std::chrono::milliseconds duration{0};
  bool healthy = false;
  std::uint32_t attempts = 0;
};

struct ProxyEvent {
  std::string tenant;
  std::string route;
  int status = 0;
  bool retried = false;
};

struct LogFlushEvent {
  std::string tenant;
  std::size_t entries = 0;
  std::string key;
};

struct LifecycleEvent {
  std::string controller;
  std::string action;
};

struct NoticeEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SandboxEvent, ConfigInjectEvent, AgentStartEvent, ProxyEvent,
                                   LogFlushEvent, LifecycleEvent, NoticeEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

struct ActiveSandboxesMetric {
  std::uint64_t count = 0;
};

struct LogBufferDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, TokensUsedMetric, ActiveSandboxesMetric,
                                    LogBufferDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace warden::observability
