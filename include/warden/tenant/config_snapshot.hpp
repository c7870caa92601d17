#pragma once

#include <optional>
#include <string>
#include <vector>

namespace warden::tenant {

struct Skill {
  std::string name;
  /// Absent when the content fetch failed; such skills are not written.
  std::optional<std::string> content;
};

struct Connector {
  std::string name;
  std::string type;
  /// Raw JSON value as delivered by the config service.
  std::string config_json = "{}";
};

/// What one (tenant, user) pair should see inside the sandbox. Replaced, never mutated.
struct ConfigSnapshot {
  std::string tenant_id;
  std::string user_id;
  std::vector<Skill> skills;
  std::vector<Connector> connectors;
};

/// Hex SHA-256 over the canonical form of skills and connectors. Key order inside
/// connector configs and whitespace do not affect the result.
[[nodiscard]] std::string compute_config_hash(const ConfigSnapshot &snapshot);

/// The connectors.json document written into the sandbox.
[[nodiscard]] std::string render_connectors_json(const std::vector<Connector> &connectors);

/// Names limited to [A-Za-z0-9._-], not "." or containing "..".
[[nodiscard]] bool is_safe_skill_name(const std::string &name);

} // namespace warden::tenant
