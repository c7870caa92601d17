#pragma once

#include "warden/common/clock.hpp"
#include "warden/common/result.hpp"
#include "warden/storage/state_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace warden::tenant {

/// The state that survives controller eviction: last activity and tenant identity,
/// stored under the controller's scope.
class DurableMarker {
public:
  DurableMarker(std::shared_ptr<storage::IStateStore> store, std::string scope);

  [[nodiscard]] common::Status touch(const std::string &tenant_id, common::TimePoint now);
  [[nodiscard]] common::Result<std::optional<common::TimePoint>> last_activity();
  [[nodiscard]] common::Result<std::optional<std::string>> tenant_id();

  [[nodiscard]] const std::string &scope() const { return scope_; }

private:
  std::shared_ptr<storage::IStateStore> store_;
  std::string scope_;
};

} // namespace warden::tenant
