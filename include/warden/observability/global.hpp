#pragma once

#include "warden/observability/observer.hpp"

#include <memory>

namespace warden::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_sandbox(const std::string &sandbox, const std::string &action, bool success,
                    const std::string &detail = "");
void record_config_inject(const std::string &tenant, const std::string &hash, std::size_t skills,
                          bool skipped);
void record_agent_start(const std::string &sandbox, std::chrono::milliseconds duration,
                        bool healthy, std::uint32_t attempts);
void record_proxy(const std::string &tenant, const std::string &route, int status, bool retried);
void record_log_flush(const std::string &tenant, std::size_t entries, const std::string &key);
void record_lifecycle(const std::string &controller, const std::string &action);
void record_notice(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace warden::observability
