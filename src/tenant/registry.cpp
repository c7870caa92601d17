#include "warden/tenant/registry.hpp"

#include "warden/observability/global.hpp"
#include "warden/sandbox/sandbox.hpp"

namespace warden::tenant {

ControllerRegistry::ControllerRegistry(std::string name_prefix, Factory factory)
    : name_prefix_(std::move(name_prefix)), factory_(std::move(factory)) {}

std::string ControllerRegistry::name_for_tenant(const std::string &tenant_id) const {
  return sandbox::sandbox_name_for_tenant(name_prefix_, tenant_id);
}

std::shared_ptr<TenantController> ControllerRegistry::for_tenant(const std::string &tenant_id) {
  return get_or_create(name_for_tenant(tenant_id));
}

std::shared_ptr<TenantController> ControllerRegistry::get_or_create(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = controllers_.find(name);
  if (it != controllers_.end()) {
    return it->second;
  }
  auto controller = factory_(name);
  controllers_.emplace(name, controller);
  observability::record_lifecycle(name, "rehydrated");
  record_active_locked();
  return controller;
}

std::shared_ptr<TenantController> ControllerRegistry::find(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = controllers_.find(name);
  return it == controllers_.end() ? nullptr : it->second;
}

bool ControllerRegistry::evict(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (controllers_.erase(name) == 0) {
    return false;
  }
  observability::record_lifecycle(name, "evicted");
  record_active_locked();
  return true;
}

std::size_t ControllerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return controllers_.size();
}

AlarmOutcome ControllerRegistry::dispatch_alarm(const std::string &name) {
  auto controller = get_or_create(name);
  auto outcome = controller->on_alarm();
  if (outcome.evict && !evict_if_unused(name, controller)) {
    // A request holds the instance and will provision it again; it stays the only one.
    outcome.evict = false;
  }
  return outcome;
}

bool ControllerRegistry::evict_if_unused(const std::string &name,
                                         const std::shared_ptr<TenantController> &controller) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = controllers_.find(name);
  if (it == controllers_.end() || it->second != controller) {
    return false;
  }
  // The map and the caller hold the only references; for_tenant cannot hand out
  // another while the lock is held.
  if (controller.use_count() > 2 || controller->state() != ControllerState::Idle) {
    return false;
  }
  controllers_.erase(it);
  observability::record_lifecycle(name, "evicted");
  record_active_locked();
  return true;
}

void ControllerRegistry::record_active_locked() const {
  observability::record_metric(observability::ActiveSandboxesMetric{
      .count = static_cast<std::uint64_t>(controllers_.size())});
}

} // namespace warden::tenant
