#pragma once

#include "warden/common/clock.hpp"
#include "warden/tenant/config_snapshot.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace warden::tenant {

/// Holds the most recent snapshot for one controller, valid for `ttl` after it was
/// stored. A lookup for a different (tenant, user) pair is a miss.
class ConfigCache {
public:
  ConfigCache(std::chrono::milliseconds ttl, std::shared_ptr<common::Clock> clock);

  [[nodiscard]] std::optional<ConfigSnapshot> get(const std::string &tenant_id,
                                                  const std::string &user_id) const;
  void put(ConfigSnapshot snapshot);

private:
  struct Entry {
    ConfigSnapshot snapshot;
    common::TimePoint fetched_at;
  };

  std::chrono::milliseconds ttl_;
  std::shared_ptr<common::Clock> clock_;
  std::optional<Entry> entry_;
};

} // namespace warden::tenant
