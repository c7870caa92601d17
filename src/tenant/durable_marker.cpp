#include "warden/tenant/durable_marker.hpp"

#include <charconv>

namespace warden::tenant {

namespace {

constexpr const char *kLastActivityKey = "lastActivity";
constexpr const char *kTenantIdKey = "tenantId";

} // namespace

DurableMarker::DurableMarker(std::shared_ptr<storage::IStateStore> store, std::string scope)
    : store_(std::move(store)), scope_(std::move(scope)) {}

common::Status DurableMarker::touch(const std::string &tenant_id, const common::TimePoint now) {
  if (auto status = store_->put(scope_, kTenantIdKey, tenant_id); !status.ok()) {
    return status;
  }
  return store_->put(scope_, kLastActivityKey, std::to_string(common::to_unix_ms(now)));
}

common::Result<std::optional<common::TimePoint>> DurableMarker::last_activity() {
  using ResultT = common::Result<std::optional<common::TimePoint>>;
  auto raw = store_->get(scope_, kLastActivityKey);
  if (!raw.ok()) {
    return ResultT::failure(raw.error());
  }
  if (!raw.value().has_value()) {
    return ResultT::success(std::nullopt);
  }
  const std::string &text = *raw.value();
  std::int64_t ms = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return ResultT::failure("corrupt lastActivity value: " + text, common::ErrorKind::Invalid);
  }
  return ResultT::success(common::from_unix_ms(ms));
}

common::Result<std::optional<std::string>> DurableMarker::tenant_id() {
  return store_->get(scope_, kTenantIdKey);
}

} // namespace warden::tenant
