#include "warden/observability/log_observer.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace warden::observability {

namespace {

std::mutex g_log_mutex;

void log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SandboxEvent>) {
          std::string line = "sandbox." + evt.action + " name=" + evt.sandbox;
          if (!evt.detail.empty()) {
            line += " " + evt.detail;
          }
          log_line(evt.success ? "INFO" : "ERROR", line);
        } else if constexpr (std::is_same_v<T, ConfigInjectEvent>) {
          log_line(evt.skipped ? "DEBUG" : "INFO",
                   std::string(evt.skipped ? "config.skip" : "config.inject") +
                       " tenant=" + evt.tenant + " hash=" + evt.hash.substr(0, 12) +
                       " skills=" + std::to_string(evt.skills));
        } else if constexpr (std::is_same_v<T, AgentStartEvent>) {
          log_line(evt.healthy ? "INFO" : "ERROR",
                   "agent.start sandbox=" + evt.sandbox + " healthy=" + bool_text(evt.healthy) +
                       " attempts=" + std::to_string(evt.attempts) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ProxyEvent>) {
          log_line(evt.status >= 500 || evt.status == 0 ? "WARN" : "DEBUG",
                   "proxy route=" + evt.route + " tenant=" + evt.tenant +
                       " status=" + std::to_string(evt.status) +
                       " retried=" + bool_text(evt.retried));
        } else if constexpr (std::is_same_v<T, LogFlushEvent>) {
          log_line("DEBUG", "logs.flush tenant=" + evt.tenant +
                                " entries=" + std::to_string(evt.entries) + " key=" + evt.key);
        } else if constexpr (std::is_same_v<T, LifecycleEvent>) {
          log_line("INFO", "lifecycle." + evt.action + " controller=" + evt.controller);
        } else if constexpr (std::is_same_v<T, NoticeEvent>) {
          log_line("INFO", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line("DEBUG", "metric.tokens_used=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, ActiveSandboxesMetric>) {
          log_line("DEBUG", "metric.active_sandboxes=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, LogBufferDepthMetric>) {
          log_line("DEBUG", "metric.log_buffer_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

} // namespace warden::observability
