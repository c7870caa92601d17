#include "warden/tenant/supervisor.hpp"

#include "warden/common/fs.hpp"
#include "warden/health/health.hpp"
#include "warden/observability/global.hpp"
#include "warden/sandbox/diagnostics.hpp"

#include <array>
#include <chrono>

namespace warden::tenant {

namespace {

constexpr std::chrono::milliseconds kProbeTimeout{2'000};

constexpr std::array<std::string_view, 4> kSecretVariables = {
    "ANTHROPIC_API_KEY", "AWS_ACCESS_KEY_ID", "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN"};

bool is_secret(const std::string &name) {
  for (const auto secret : kSecretVariables) {
    if (name == secret) {
      return true;
    }
  }
  return false;
}

} // namespace

ProcessSupervisor::ProcessSupervisor(config::AgentConfig agent,
                                     config::CredentialsConfig credentials,
                                     common::Sleeper sleeper)
    : agent_(std::move(agent)), credentials_(std::move(credentials)), sleeper_(std::move(sleeper)) {}

common::Status ProcessSupervisor::ensure_agent_running(sandbox::ISandbox &sandbox,
                                                       const ConfigSnapshot &snapshot) {
  if (believed_running_) {
    return common::Status::success();
  }

  // A rehydrated controller may find an agent left running by its predecessor.
  if (probe_health(sandbox)) {
    believed_running_ = true;
    observability::record_notice("supervisor", "agent already healthy in " + sandbox.name());
    return common::Status::success();
  }

  return cold_start(sandbox, snapshot);
}

bool ProcessSupervisor::probe_health(sandbox::ISandbox &sandbox) {
  const auto response = sandbox.http_call(
      sandbox::SandboxHttpRequest{.method = "GET", .path = "/health", .timeout = kProbeTimeout},
      agent_.port);
  return !response.failed() && response.status == 200 &&
         response.body.find("ok") != std::string::npos;
}

sandbox::EnvList ProcessSupervisor::build_environment(const ConfigSnapshot &snapshot) const {
  sandbox::EnvList env = {
      {"NODE_ENV", "production"},
      {"TENANT_ID", snapshot.tenant_id},
      {"USER_ID", snapshot.user_id},
      {"SKILLS_PATH", agent_.skills_path},
      {"CONNECTORS_CONFIG", render_connectors_json(snapshot.connectors)},
      {"PORT", std::to_string(agent_.port)},
  };
  if (credentials_.anthropic_api_key.has_value()) {
    env.emplace_back("ANTHROPIC_API_KEY", *credentials_.anthropic_api_key);
  }
  if (credentials_.aws_access_key_id.has_value()) {
    env.emplace_back("AWS_ACCESS_KEY_ID", *credentials_.aws_access_key_id);
    env.emplace_back("AWS_SECRET_ACCESS_KEY", credentials_.aws_secret_access_key.value_or(""));
    env.emplace_back("AWS_REGION", credentials_.aws_region);
    env.emplace_back("CLAUDE_CODE_USE_BEDROCK", "1");
    if (credentials_.aws_session_token.has_value()) {
      env.emplace_back("AWS_SESSION_TOKEN", *credentials_.aws_session_token);
    }
  }
  return env;
}

std::string ProcessSupervisor::describe_environment(const sandbox::EnvList &env) {
  std::string out;
  for (const auto &[name, value] : env) {
    if (name == "CONNECTORS_CONFIG") {
      continue;
    }
    if (!out.empty()) {
      out += " ";
    }
    out += name + "=" + (is_secret(name) ? (value.empty() ? "not set" : "set") : value);
  }
  for (const auto secret : kSecretVariables) {
    bool present = false;
    for (const auto &entry : env) {
      present = present || entry.first == secret;
    }
    if (!present) {
      out += " " + std::string(secret) + "=not set";
    }
  }
  return out;
}

common::Status ProcessSupervisor::cold_start(sandbox::ISandbox &sandbox,
                                             const ConfigSnapshot &snapshot) {
  const std::string component = health::sandbox_component(sandbox.name());
  if (cold_starts_ > 0) {
    health::bump_component_restart(component);
  }
  ++cold_starts_;
  const auto started = std::chrono::steady_clock::now();

  const auto env = build_environment(snapshot);
  observability::record_notice("supervisor", "starting agent in " + sandbox.name() + ": " +
                                                 describe_environment(env));

  // Appends: the log pipeline's line offset survives restarts within one sandbox.
  const sandbox::ProcessSpec spec{
      .command = "bash -c " + common::shell_quote(agent_.entrypoint + " >> " +
                                                  common::shell_quote(agent_.log_path) + " 2>&1"),
      .cwd = agent_.workdir,
      .env = env,
  };
  auto pid = sandbox.start_process(spec);
  if (!pid.ok()) {
    const auto diagnostics = sandbox::collect_diagnostics(sandbox, agent_.log_path).to_string();
    health::mark_component_error(component, pid.error());
    return common::Status::error("agent launch failed: " + pid.error(),
                                 common::ErrorKind::ColdStart, diagnostics);
  }

  auto ready = wait_for_server(sandbox);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (!ready.ok()) {
    observability::record_agent_start(sandbox.name(), elapsed, false, last_probe_attempts_);
    health::mark_component_error(component, ready.error());
    return ready;
  }

  believed_running_ = true;
  observability::record_agent_start(sandbox.name(), elapsed, true, last_probe_attempts_);
  return common::Status::success();
}

common::Status ProcessSupervisor::wait_for_server(sandbox::ISandbox &sandbox) {
  for (std::uint32_t attempt = 1; attempt <= agent_.health_attempts; ++attempt) {
    last_probe_attempts_ = attempt;
    if (probe_health(sandbox)) {
      return common::Status::success();
    }
    if (attempt < agent_.health_attempts) {
      sleeper_(agent_.health_interval);
    }
  }

  const auto diagnostics = sandbox::collect_diagnostics(sandbox, agent_.log_path).to_string();
  return common::Status::error("agent server did not become healthy after " +
                                   std::to_string(agent_.health_attempts) + " attempts",
                               common::ErrorKind::ColdStart, diagnostics);
}

} // namespace warden::tenant
