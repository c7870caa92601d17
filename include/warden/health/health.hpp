#pragma once

#include "warden/common/clock.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace warden::health {

enum class ComponentState { Starting, Ok, Error };

[[nodiscard]] std::string_view component_state_name(ComponentState state);

struct ComponentStatus {
  ComponentState state = ComponentState::Starting;
  std::size_t restart_count = 0;
  std::optional<std::string> last_error;
  std::optional<common::TimePoint> updated_at;
  std::optional<common::TimePoint> last_ok;
};

/// Daemon services (gateway, scheduler) and tenant sandboxes are tracked apart so
/// one failing tenant shows up without hiding the service view.
struct HealthSnapshot {
  common::TimePoint taken_at;
  std::chrono::seconds uptime{0};
  std::map<std::string, ComponentStatus> services;
  std::map<std::string, ComponentStatus> sandboxes;

  [[nodiscard]] bool degraded() const;
};

/// Clock used for timestamps and uptime; the system clock when unset.
void set_clock(std::shared_ptr<common::Clock> clock);

/// Component name under which a sandbox is tracked: "sandbox:<name>".
[[nodiscard]] std::string sandbox_component(const std::string &sandbox_name);

void mark_component_starting(const std::string &name);
void mark_component_ok(const std::string &name);
void mark_component_error(const std::string &name, const std::string &error);
void bump_component_restart(const std::string &name);
void reset_component(const std::string &name);

[[nodiscard]] std::optional<ComponentStatus> get_component(const std::string &name);
[[nodiscard]] HealthSnapshot snapshot();

/// {"status":"ok"|"degraded","uptime_seconds":N,"sandboxes":{"total","ready","failing"},
///  "components":{...}}. Degraded when a service or sandbox is in error.
[[nodiscard]] std::string snapshot_json();

/// Forgets every component and restarts the uptime count.
void clear();

} // namespace warden::health
