#pragma once

#include "warden/common/clock.hpp"
#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/net/http_client.hpp"
#include "warden/net/websocket.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/tenant/supervisor.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace warden::tenant {

/// Caller identity and payload forwarded to the agent.
struct ProxyRequest {
  std::string path;
  std::string tenant_id;
  std::string user_id;
  std::string roles;
  std::string body;
};

/// Receives a relayed stream. `begin` runs once with the upstream status before any
/// bytes; returning false from either callback means the client went away.
struct StreamSink {
  std::function<bool(std::uint16_t status)> begin;
  std::function<bool(std::string_view chunk)> write;
};

struct StreamOutcome {
  std::uint16_t status = 0;
  bool interrupted = false;
  bool client_closed = false;
  std::uint64_t tokens = 0;
};

constexpr int kWebSocketAttempts = 3;

class RequestProxy {
public:
  using Restart = std::function<common::Status()>;
  /// Runs one upgrade attempt (0-based); attempts after the first must reset
  /// process state and bring the sandbox up again before connecting.
  using WebSocketAttempt = std::function<common::Result<net::WebSocketTunnel>(int attempt)>;

  RequestProxy(config::AgentConfig agent, std::vector<std::chrono::milliseconds> websocket_backoff,
               common::Sleeper sleeper);

  /// One call, and on failure exactly one restart-and-retry. Non-5xx responses are
  /// returned as-is for the caller to interpret.
  [[nodiscard]] common::Result<net::HttpResponse> proxy_chat(sandbox::ISandbox &sandbox,
                                                             ProcessSupervisor &supervisor,
                                                             const Restart &restart,
                                                             const ProxyRequest &request);

  /// Relays the agent's stream unbuffered. Never retried; a failure after the first
  /// byte ends the stream with a stream_interrupted line.
  [[nodiscard]] common::Result<StreamOutcome> proxy_stream(sandbox::ISandbox &sandbox,
                                                           ProcessSupervisor &supervisor,
                                                           const ProxyRequest &request,
                                                           const StreamSink &sink);

  /// Up to kWebSocketAttempts attempts, sleeping the configured backoff between them.
  [[nodiscard]] common::Result<net::WebSocketTunnel>
  proxy_websocket(const std::string &tenant_id, const WebSocketAttempt &attempt);

  [[nodiscard]] sandbox::SandboxHttpRequest build_request(const ProxyRequest &request) const;

private:
  [[nodiscard]] static bool is_failure(const net::HttpResponse &response);
  [[nodiscard]] static std::string describe(const net::HttpResponse &response);

  config::AgentConfig agent_;
  std::vector<std::chrono::milliseconds> websocket_backoff_;
  common::Sleeper sleeper_;
};

} // namespace warden::tenant
