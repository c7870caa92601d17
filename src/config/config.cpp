#include "warden/config/config.hpp"

#include "warden/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace warden::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".warden";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("WARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::string> optional_value(const common::TomlDocument &doc, const std::string &key) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  const std::string value = expand_config_value(doc.get_string(key));
  if (common::trim(value).empty()) {
    return std::nullopt;
  }
  return value;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("WARDEN_ENV_FILE"); env_file != nullptr && *env_file) {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  static const std::regex host_re(
      R"(^(([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)*[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?|((25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9]))$)");
  return std::regex_match(host, host_re);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *host = env_value("WARDEN_GATEWAY_HOST"); host != nullptr) {
    config.gateway.host = host;
  }
  if (const char *port = env_value("WARDEN_GATEWAY_PORT"); port != nullptr) {
    const std::string raw(port);
    std::uint16_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      config.gateway.port = parsed;
    }
  }
  if (const char *image = env_value("WARDEN_SANDBOX_IMAGE"); image != nullptr) {
    config.sandbox.image = image;
  }
  if (const char *backend = env_value("WARDEN_OBSERVABILITY"); backend != nullptr) {
    config.observability.backend = backend;
  }

  if (const char *url = env_value("CONTROL_PLANE_URL"); url != nullptr) {
    config.control_plane.url = url;
  }
  if (const char *key = env_value("INTERNAL_API_KEY"); key != nullptr) {
    config.control_plane.internal_key = key;
  }

  if (const char *key = env_value("ANTHROPIC_API_KEY"); key != nullptr) {
    config.credentials.anthropic_api_key = std::string(key);
  }
  if (const char *key = env_value("AWS_ACCESS_KEY_ID"); key != nullptr) {
    config.credentials.aws_access_key_id = std::string(key);
  }
  if (const char *secret = env_value("AWS_SECRET_ACCESS_KEY"); secret != nullptr) {
    config.credentials.aws_secret_access_key = std::string(secret);
  }
  if (const char *token = env_value("AWS_SESSION_TOKEN"); token != nullptr) {
    config.credentials.aws_session_token = std::string(token);
  }
  if (const char *region = env_value("AWS_REGION"); region != nullptr) {
    config.credentials.aws_region = region;
  }
}

common::Result<Config> config_from_toml(const common::TomlDocument &doc) {
  Config config;

  config.gateway.host = doc.get_string("gateway.host", config.gateway.host);
  const auto port = doc.get_u64("gateway.port", config.gateway.port);
  if (port > 65535) {
    return common::Result<Config>::failure("gateway.port must be 1-65535",
                                           common::ErrorKind::Invalid);
  }
  config.gateway.port = static_cast<std::uint16_t>(port);
  config.gateway.allow_public_bind =
      doc.get_bool("gateway.allow_public_bind", config.gateway.allow_public_bind);
  config.gateway.max_body_bytes = static_cast<std::size_t>(
      doc.get_u64("gateway.max_body_bytes", config.gateway.max_body_bytes));

  config.sandbox.image = expand_config_value(doc.get_string("sandbox.image", config.sandbox.image));
  config.sandbox.name_prefix = doc.get_string("sandbox.name_prefix", config.sandbox.name_prefix);
  config.sandbox.network = doc.get_string("sandbox.network", config.sandbox.network);
  config.sandbox.memory_limit = optional_value(doc, "sandbox.memory_limit");
  if (doc.has("sandbox.cpu_limit")) {
    const std::string raw = doc.get_string("sandbox.cpu_limit");
    char *end = nullptr;
    const double cpus = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str() || cpus <= 0.0) {
      return common::Result<Config>::failure("sandbox.cpu_limit must be a positive number",
                                             common::ErrorKind::Invalid);
    }
    config.sandbox.cpu_limit = cpus;
  }
  if (doc.has("sandbox.pids_limit")) {
    config.sandbox.pids_limit = static_cast<std::uint32_t>(doc.get_u64("sandbox.pids_limit", 0));
  }
  config.sandbox.docker_timeout =
      doc.get_duration("sandbox.docker_timeout", config.sandbox.docker_timeout);

  const auto agent_port = doc.get_u64("agent.port", config.agent.port);
  if (agent_port == 0 || agent_port > 65535) {
    return common::Result<Config>::failure("agent.port must be 1-65535",
                                           common::ErrorKind::Invalid);
  }
  config.agent.port = static_cast<std::uint16_t>(agent_port);
  config.agent.entrypoint = doc.get_string("agent.entrypoint", config.agent.entrypoint);
  config.agent.workdir = doc.get_string("agent.workdir", config.agent.workdir);
  config.agent.log_path = doc.get_string("agent.log_path", config.agent.log_path);
  config.agent.skills_path = doc.get_string("agent.skills_path", config.agent.skills_path);
  config.agent.config_dir = doc.get_string("agent.config_dir", config.agent.config_dir);
  config.agent.health_attempts = static_cast<std::uint32_t>(
      doc.get_u64("agent.health_attempts", config.agent.health_attempts));
  config.agent.health_interval =
      doc.get_duration("agent.health_interval", config.agent.health_interval);
  config.agent.request_timeout =
      doc.get_duration("agent.request_timeout", config.agent.request_timeout);

  config.lifecycle.idle_threshold =
      doc.get_duration("lifecycle.idle_threshold", config.lifecycle.idle_threshold);
  config.lifecycle.flush_interval =
      doc.get_duration("lifecycle.flush_interval", config.lifecycle.flush_interval);
  config.lifecycle.config_ttl = doc.get_duration("lifecycle.config_ttl", config.lifecycle.config_ttl);
  if (doc.has("lifecycle.websocket_backoff")) {
    std::vector<std::chrono::milliseconds> backoff;
    for (const auto &entry : doc.get_string_array("lifecycle.websocket_backoff")) {
      const auto delay = common::parse_duration(entry);
      if (!delay.has_value()) {
        return common::Result<Config>::failure("invalid lifecycle.websocket_backoff entry: " + entry,
                                               common::ErrorKind::Invalid);
      }
      backoff.push_back(*delay);
    }
    config.lifecycle.websocket_backoff = std::move(backoff);
  }

  config.logs.buffer_cap =
      static_cast<std::size_t>(doc.get_u64("logs.buffer_cap", config.logs.buffer_cap));
  config.logs.retention_days =
      static_cast<std::uint32_t>(doc.get_u64("logs.retention_days", config.logs.retention_days));
  config.logs.blob_root = doc.get_string("logs.blob_root", config.logs.blob_root);
  config.logs.max_lines_per_pull = static_cast<std::size_t>(
      doc.get_u64("logs.max_lines_per_pull", config.logs.max_lines_per_pull));

  config.control_plane.url = expand_config_value(doc.get_string("control_plane.url"));
  config.control_plane.internal_key =
      expand_config_value(doc.get_string("control_plane.internal_key"));
  config.control_plane.timeout =
      doc.get_duration("control_plane.timeout", config.control_plane.timeout);

  config.credentials.anthropic_api_key = optional_value(doc, "credentials.anthropic_api_key");
  config.credentials.aws_access_key_id = optional_value(doc, "credentials.aws_access_key_id");
  config.credentials.aws_secret_access_key =
      optional_value(doc, "credentials.aws_secret_access_key");
  config.credentials.aws_session_token = optional_value(doc, "credentials.aws_session_token");
  config.credentials.aws_region =
      doc.get_string("credentials.aws_region", config.credentials.aws_region);

  config.state.db_path = doc.get_string("state.db_path", config.state.db_path);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           common::ErrorKind::Invalid);
  }

  auto config = config_from_toml(parsed.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Failure = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.gateway.port == 0) {
    return Failure::failure("gateway.port must be 1-65535", common::ErrorKind::Invalid);
  }
  if (!is_valid_host(config.gateway.host)) {
    return Failure::failure("gateway.host is invalid: " + config.gateway.host,
                            common::ErrorKind::Invalid);
  }
  if (common::trim(config.sandbox.image).empty()) {
    return Failure::failure("sandbox.image must not be empty", common::ErrorKind::Invalid);
  }
  if (common::trim(config.sandbox.name_prefix).empty()) {
    return Failure::failure("sandbox.name_prefix must not be empty", common::ErrorKind::Invalid);
  }
  if (config.agent.health_attempts == 0) {
    return Failure::failure("agent.health_attempts must be at least 1",
                            common::ErrorKind::Invalid);
  }
  if (config.lifecycle.websocket_backoff.empty()) {
    return Failure::failure("lifecycle.websocket_backoff must list at least one delay",
                            common::ErrorKind::Invalid);
  }
  if (config.logs.buffer_cap == 0) {
    return Failure::failure("logs.buffer_cap must be at least 1", common::ErrorKind::Invalid);
  }
  if (config.lifecycle.flush_interval > config.lifecycle.idle_threshold) {
    warnings.push_back("lifecycle.flush_interval exceeds lifecycle.idle_threshold");
  }

  if (!config.control_plane.url.empty() && config.control_plane.internal_key.empty()) {
    warnings.push_back("control_plane.url is set without control_plane.internal_key; "
                       "tenants will run with an empty configuration");
  }
  if (!config.credentials.anthropic_api_key.has_value() &&
      !config.credentials.aws_access_key_id.has_value()) {
    warnings.push_back("no agent credentials configured (anthropic_api_key or aws_access_key_id)");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace warden::config
