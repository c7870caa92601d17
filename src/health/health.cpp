#include "warden/health/health.hpp"

#include "warden/common/json_util.hpp"

#include <mutex>
#include <sstream>

namespace warden::health {

namespace {

constexpr std::string_view SANDBOX_PREFIX = "sandbox:";

struct Registry {
  std::mutex mutex;
  std::shared_ptr<common::Clock> clock = common::system_clock();
  std::optional<common::TimePoint> started_at;
  std::map<std::string, ComponentStatus> components;

  common::TimePoint now() {
    const auto time = clock->now();
    if (!started_at.has_value()) {
      started_at = time;
    }
    return time;
  }
};

Registry &registry() {
  static Registry instance;
  return instance;
}

bool is_sandbox(const std::string &name) { return name.rfind(SANDBOX_PREFIX, 0) == 0; }

template <typename Update> void update_component(const std::string &name, Update &&update) {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  auto &component = reg.components[name];
  const auto now = reg.now();
  update(component, now);
  component.updated_at = now;
}

void write_component(std::ostringstream &out, const std::string &name,
                     const ComponentStatus &status) {
  out << common::json_string(name) << ":{\"status\":\"" << component_state_name(status.state)
      << "\",\"restart_count\":" << status.restart_count;
  if (status.updated_at.has_value()) {
    out << ",\"updated_at\":" << common::json_string(common::format_rfc3339(*status.updated_at));
  }
  if (status.last_ok.has_value()) {
    out << ",\"last_ok\":" << common::json_string(common::format_rfc3339(*status.last_ok));
  }
  if (status.last_error.has_value()) {
    out << ",\"last_error\":" << common::json_string(*status.last_error);
  }
  out << "}";
}

} // namespace

std::string_view component_state_name(const ComponentState state) {
  switch (state) {
  case ComponentState::Starting:
    return "starting";
  case ComponentState::Ok:
    return "ok";
  case ComponentState::Error:
    return "error";
  }
  return "unknown";
}

bool HealthSnapshot::degraded() const {
  for (const auto *group : {&services, &sandboxes}) {
    for (const auto &[name, status] : *group) {
      if (status.state == ComponentState::Error) {
        return true;
      }
    }
  }
  return false;
}

void set_clock(std::shared_ptr<common::Clock> clock) {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  reg.clock = clock ? std::move(clock) : common::system_clock();
  reg.started_at.reset();
}

std::string sandbox_component(const std::string &sandbox_name) {
  return std::string(SANDBOX_PREFIX) + sandbox_name;
}

void mark_component_starting(const std::string &name) {
  update_component(name, [](ComponentStatus &component, common::TimePoint) {
    component.state = ComponentState::Starting;
    component.last_error.reset();
  });
}

void mark_component_ok(const std::string &name) {
  update_component(name, [](ComponentStatus &component, const common::TimePoint now) {
    component.state = ComponentState::Ok;
    component.last_ok = now;
    component.last_error.reset();
  });
}

void mark_component_error(const std::string &name, const std::string &error) {
  update_component(name, [&error](ComponentStatus &component, common::TimePoint) {
    component.state = ComponentState::Error;
    component.last_error = error;
  });
}

void bump_component_restart(const std::string &name) {
  update_component(name, [](ComponentStatus &component, common::TimePoint) {
    ++component.restart_count;
  });
}

void reset_component(const std::string &name) {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  reg.components.erase(name);
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  const auto it = reg.components.find(name);
  if (it == reg.components.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot snapshot() {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  HealthSnapshot snap;
  snap.taken_at = reg.now();
  snap.uptime = std::chrono::duration_cast<std::chrono::seconds>(snap.taken_at - *reg.started_at);
  for (const auto &[name, status] : reg.components) {
    if (is_sandbox(name)) {
      snap.sandboxes.emplace(name.substr(SANDBOX_PREFIX.size()), status);
    } else {
      snap.services.emplace(name, status);
    }
  }
  return snap;
}

std::string snapshot_json() {
  const auto snap = snapshot();

  std::size_t ready = 0;
  std::size_t failing = 0;
  for (const auto &[name, status] : snap.sandboxes) {
    ready += status.state == ComponentState::Ok ? 1 : 0;
    failing += status.state == ComponentState::Error ? 1 : 0;
  }

  std::ostringstream json;
  json << "{\"status\":\"" << (snap.degraded() ? "degraded" : "ok") << "\""
       << ",\"uptime_seconds\":" << snap.uptime.count() << ",\"sandboxes\":{\"total\":"
       << snap.sandboxes.size() << ",\"ready\":" << ready << ",\"failing\":" << failing << "}"
       << ",\"components\":{";
  bool first = true;
  for (const auto &[name, status] : snap.services) {
    if (!first) {
      json << ",";
    }
    first = false;
    write_component(json, name, status);
  }
  for (const auto &[name, status] : snap.sandboxes) {
    if (!first) {
      json << ",";
    }
    first = false;
    write_component(json, sandbox_component(name), status);
  }
  json << "}}";
  return json.str();
}

void clear() {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  reg.components.clear();
  reg.started_at.reset();
}

} // namespace warden::health
