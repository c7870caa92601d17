#include "warden/tenant/config_snapshot.hpp"

#include "warden/common/json_util.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace warden::tenant {

namespace {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    out << std::setw(2) << static_cast<int>(c);
  }
  return out.str();
}

// Invalid JSON falls back to its literal text so it still hashes deterministically.
std::string canonical_config(const std::string &config_json) {
  auto canonical = common::json_canonicalize(config_json.empty() ? "null" : config_json);
  if (!canonical.ok()) {
    return common::json_string(config_json);
  }
  return canonical.value();
}

} // namespace

std::string compute_config_hash(const ConfigSnapshot &snapshot) {
  std::ostringstream canonical;
  canonical << "{\"connectors\":[";
  for (std::size_t i = 0; i < snapshot.connectors.size(); ++i) {
    const auto &connector = snapshot.connectors[i];
    if (i > 0) {
      canonical << ",";
    }
    canonical << "{\"config\":" << canonical_config(connector.config_json)
              << ",\"name\":" << common::json_string(connector.name)
              << ",\"type\":" << common::json_string(connector.type) << "}";
  }
  canonical << "],\"skills\":[";
  for (std::size_t i = 0; i < snapshot.skills.size(); ++i) {
    const auto &skill = snapshot.skills[i];
    if (i > 0) {
      canonical << ",";
    }
    canonical << "{\"content\":"
              << (skill.content.has_value() ? common::json_string(*skill.content) : "null")
              << ",\"name\":" << common::json_string(skill.name) << "}";
  }
  canonical << "]}";
  return sha256_hex(canonical.str());
}

std::string render_connectors_json(const std::vector<Connector> &connectors) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < connectors.size(); ++i) {
    const auto &connector = connectors[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "  {\"name\": " << common::json_string(connector.name)
        << ", \"type\": " << common::json_string(connector.type)
        << ", \"config\": " << (connector.config_json.empty() ? "null" : connector.config_json)
        << "}";
  }
  out << (connectors.empty() ? "]\n" : "\n]\n");
  return out.str();
}

bool is_safe_skill_name(const std::string &name) {
  if (name.empty() || name == "." || name.find("..") != std::string::npos) {
    return false;
  }
  for (const char ch : name) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' || ch == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace warden::tenant
