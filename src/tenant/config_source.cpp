#include "warden/tenant/config_source.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"
#include "warden/observability/global.hpp"

namespace warden::tenant {

namespace {

bool is_success(const net::HttpResponse &response) {
  return !response.failed() && response.status >= 200 && response.status < 300;
}

std::string describe(const net::HttpResponse &response) {
  if (response.timeout) {
    return "timeout";
  }
  if (response.network_error) {
    return response.network_error_message;
  }
  return "HTTP " + std::to_string(response.status);
}

} // namespace

ConfigSnapshot empty_snapshot(const std::string &tenant_id, const std::string &user_id) {
  return ConfigSnapshot{.tenant_id = tenant_id, .user_id = user_id, .skills = {}, .connectors = {}};
}

common::Result<ConfigSnapshot> parse_sandbox_config(const std::string &body,
                                                    const std::string &tenant_id,
                                                    const std::string &user_id) {
  const std::string trimmed = common::trim(body);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<ConfigSnapshot>::failure("sandbox config is not a JSON object",
                                                   common::ErrorKind::ConfigFetch);
  }

  ConfigSnapshot snapshot = empty_snapshot(tenant_id, user_id);
  const auto members = common::json_object_members(trimmed);

  const std::string skills = common::json_member(members, "skills");
  for (const auto &raw : common::json_split_top_level_objects(skills)) {
    const auto skill = common::json_object_members(raw);
    const std::string name = common::json_value_as_string(common::json_member(skill, "name"));
    if (name.empty()) {
      continue;
    }
    snapshot.skills.push_back(Skill{.name = name, .content = std::nullopt});
  }

  const std::string connectors = common::json_member(members, "connectors");
  for (const auto &raw : common::json_split_top_level_objects(connectors)) {
    const auto connector = common::json_object_members(raw);
    Connector entry;
    entry.name = common::json_value_as_string(common::json_member(connector, "name"));
    entry.type = common::json_value_as_string(common::json_member(connector, "type"));
    const std::string config = common::json_member(connector, "config");
    entry.config_json = config.empty() ? "null" : config;
    snapshot.connectors.push_back(std::move(entry));
  }

  return common::Result<ConfigSnapshot>::success(std::move(snapshot));
}

HttpConfigSource::HttpConfigSource(config::ControlPlaneConfig config,
                                   std::shared_ptr<net::HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

std::string HttpConfigSource::base_url() const {
  std::string url = common::trim(config_.url);
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

common::Result<ConfigSnapshot> HttpConfigSource::fetch(const std::string &tenant_id,
                                                       const std::string &user_id) {
  if (base_url().empty() || config_.internal_key.empty()) {
    return common::Result<ConfigSnapshot>::failure("control plane is not configured",
                                                   common::ErrorKind::ConfigFetch);
  }

  const std::string url = base_url() + "/internal/sandbox-config?tenantId=" +
                          common::url_encode(tenant_id) + "&userId=" + common::url_encode(user_id);
  const auto response =
      http_client_->get(url, {{"X-Internal-Key", config_.internal_key}}, config_.timeout);
  if (!is_success(response)) {
    return common::Result<ConfigSnapshot>::failure("sandbox config fetch failed: " +
                                                       describe(response),
                                                   common::ErrorKind::ConfigFetch);
  }

  auto parsed = parse_sandbox_config(response.body, tenant_id, user_id);
  if (!parsed.ok()) {
    return parsed;
  }
  for (auto &skill : parsed.value().skills) {
    skill.content = fetch_skill_content(tenant_id, skill.name);
  }
  return parsed;
}

std::optional<std::string> HttpConfigSource::fetch_skill_content(const std::string &tenant_id,
                                                                 const std::string &skill_name) {
  const std::string url = base_url() + "/internal/skills/" + common::url_encode(skill_name) +
                          "/content?tenantId=" + common::url_encode(tenant_id);
  const auto response =
      http_client_->get(url, {{"X-Internal-Key", config_.internal_key}}, config_.timeout);
  if (!is_success(response)) {
    observability::record_error("config", "skill content fetch failed for " + skill_name + ": " +
                                              describe(response));
    return std::nullopt;
  }
  return response.body;
}

} // namespace warden::tenant
