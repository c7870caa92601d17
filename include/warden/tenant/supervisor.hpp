#pragma once

#include "warden/common/clock.hpp"
#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/tenant/config_snapshot.hpp"

#include <cstdint>
#include <string>

namespace warden::tenant {

/// Keeps the agent HTTP server inside one sandbox alive. The believed-running flag
/// is an optimistic cache: while set, ensure_agent_running trusts it without
/// touching the sandbox, and the proxy clears it when a call fails.
class ProcessSupervisor {
public:
  ProcessSupervisor(config::AgentConfig agent, config::CredentialsConfig credentials,
                    common::Sleeper sleeper);

  [[nodiscard]] common::Status ensure_agent_running(sandbox::ISandbox &sandbox,
                                                    const ConfigSnapshot &snapshot);

  /// Probes /health up to health_attempts times, sleeping health_interval between
  /// probes. Failure carries a ColdStart error with the diagnostics bundle.
  [[nodiscard]] common::Status wait_for_server(sandbox::ISandbox &sandbox);
  [[nodiscard]] bool probe_health(sandbox::ISandbox &sandbox);

  [[nodiscard]] sandbox::EnvList build_environment(const ConfigSnapshot &snapshot) const;
  /// One-line rendering with credential values reduced to set/not set.
  [[nodiscard]] static std::string describe_environment(const sandbox::EnvList &env);

  [[nodiscard]] bool believed_running() const { return believed_running_; }
  void clear_running() { believed_running_ = false; }
  [[nodiscard]] std::uint64_t cold_starts() const { return cold_starts_; }
  /// Probes made by the most recent wait_for_server.
  [[nodiscard]] std::uint32_t last_probe_attempts() const { return last_probe_attempts_; }

private:
  [[nodiscard]] common::Status cold_start(sandbox::ISandbox &sandbox, const ConfigSnapshot &snapshot);

  config::AgentConfig agent_;
  config::CredentialsConfig credentials_;
  common::Sleeper sleeper_;
  bool believed_running_ = false;
  std::uint64_t cold_starts_ = 0;
  std::uint32_t last_probe_attempts_ = 0;
};

} // namespace warden::tenant
