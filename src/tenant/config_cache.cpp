#include "warden/tenant/config_cache.hpp"

namespace warden::tenant {

ConfigCache::ConfigCache(const std::chrono::milliseconds ttl, std::shared_ptr<common::Clock> clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

std::optional<ConfigSnapshot> ConfigCache::get(const std::string &tenant_id,
                                               const std::string &user_id) const {
  if (!entry_.has_value() || entry_->snapshot.tenant_id != tenant_id ||
      entry_->snapshot.user_id != user_id) {
    return std::nullopt;
  }
  if (clock_->now() - entry_->fetched_at >= ttl_) {
    return std::nullopt;
  }
  return entry_->snapshot;
}

void ConfigCache::put(ConfigSnapshot snapshot) {
  entry_ = Entry{.snapshot = std::move(snapshot), .fetched_at = clock_->now()};
}

} // namespace warden::tenant
