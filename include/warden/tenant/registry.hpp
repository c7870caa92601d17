#pragma once

#include "warden/tenant/controller.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace warden::tenant {

/// In-memory set of live controllers keyed by deterministic name. Dropping an entry
/// loses only volatile state; the next lookup rebuilds it from the name.
class ControllerRegistry {
public:
  using Factory = std::function<std::shared_ptr<TenantController>(const std::string &name)>;

  ControllerRegistry(std::string name_prefix, Factory factory);

  [[nodiscard]] std::string name_for_tenant(const std::string &tenant_id) const;
  [[nodiscard]] std::shared_ptr<TenantController> for_tenant(const std::string &tenant_id);
  [[nodiscard]] std::shared_ptr<TenantController> get_or_create(const std::string &name);
  [[nodiscard]] std::shared_ptr<TenantController> find(const std::string &name) const;
  bool evict(const std::string &name);
  [[nodiscard]] std::size_t size() const;

  /// Runs the controller's alarm, rehydrating it if needed, and evicts it after an
  /// idle destroy unless a request still holds the instance. The returned `evict`
  /// reports whether it was dropped.
  AlarmOutcome dispatch_alarm(const std::string &name);

private:
  bool evict_if_unused(const std::string &name,
                       const std::shared_ptr<TenantController> &controller);
  void record_active_locked() const;

  std::string name_prefix_;
  Factory factory_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<TenantController>> controllers_;
};

} // namespace warden::tenant
