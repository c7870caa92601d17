#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/net/http_client.hpp"
#include "warden/tenant/config_snapshot.hpp"

#include <memory>
#include <string>

namespace warden::tenant {

class IConfigSource {
public:
  virtual ~IConfigSource() = default;
  /// Fails with ErrorKind::ConfigFetch; callers degrade to an empty snapshot.
  [[nodiscard]] virtual common::Result<ConfigSnapshot> fetch(const std::string &tenant_id,
                                                             const std::string &user_id) = 0;
};

/// Reads tenant configuration from the control plane's internal API.
class HttpConfigSource final : public IConfigSource {
public:
  HttpConfigSource(config::ControlPlaneConfig config, std::shared_ptr<net::HttpClient> http_client);

  [[nodiscard]] common::Result<ConfigSnapshot> fetch(const std::string &tenant_id,
                                                     const std::string &user_id) override;

private:
  [[nodiscard]] std::optional<std::string> fetch_skill_content(const std::string &tenant_id,
                                                               const std::string &skill_name);
  [[nodiscard]] std::string base_url() const;

  config::ControlPlaneConfig config_;
  std::shared_ptr<net::HttpClient> http_client_;
};

/// Empty snapshot used when configuration is unavailable.
[[nodiscard]] ConfigSnapshot empty_snapshot(const std::string &tenant_id, const std::string &user_id);

/// Parses `{"skills":[{"name":...}],"connectors":[{"name","type","config"}]}`; skill
/// content is left unset.
[[nodiscard]] common::Result<ConfigSnapshot> parse_sandbox_config(const std::string &body,
                                                                  const std::string &tenant_id,
                                                                  const std::string &user_id);

} // namespace warden::tenant
