#include "warden/tenant/proxy.hpp"

#include "warden/observability/global.hpp"
#include "warden/sandbox/diagnostics.hpp"
#include "warden/tenant/stream_events.hpp"

#include <algorithm>

namespace warden::tenant {

RequestProxy::RequestProxy(config::AgentConfig agent,
                           std::vector<std::chrono::milliseconds> websocket_backoff,
                           common::Sleeper sleeper)
    : agent_(std::move(agent)), websocket_backoff_(std::move(websocket_backoff)),
      sleeper_(std::move(sleeper)) {}

bool RequestProxy::is_failure(const net::HttpResponse &response) {
  return response.failed() || response.status >= 500;
}

std::string RequestProxy::describe(const net::HttpResponse &response) {
  if (response.timeout) {
    return "timeout";
  }
  if (response.network_error) {
    return response.network_error_message;
  }
  std::string text = "HTTP " + std::to_string(response.status);
  if (!response.body.empty()) {
    text += ": " + response.body.substr(0, 512);
  }
  return text;
}

sandbox::SandboxHttpRequest RequestProxy::build_request(const ProxyRequest &request) const {
  sandbox::SandboxHttpRequest out;
  out.method = "POST";
  out.path = request.path;
  out.headers = {
      {"Content-Type", "application/json"},
      {"X-Tenant-Id", request.tenant_id},
      {"X-User-Id", request.user_id},
  };
  if (!request.roles.empty()) {
    out.headers["X-User-Roles"] = request.roles;
  }
  out.body = request.body;
  out.timeout = agent_.request_timeout;
  return out;
}

common::Result<net::HttpResponse> RequestProxy::proxy_chat(sandbox::ISandbox &sandbox,
                                                           ProcessSupervisor &supervisor,
                                                           const Restart &restart,
                                                           const ProxyRequest &request) {
  const auto upstream = build_request(request);
  auto response = sandbox.http_call(upstream, agent_.port);
  if (!is_failure(response)) {
    observability::record_proxy(request.tenant_id, request.path, response.status, false);
    return common::Result<net::HttpResponse>::success(std::move(response));
  }

  observability::record_error("proxy", "call to " + sandbox.name() + request.path +
                                           " failed, restarting agent: " + describe(response));
  supervisor.clear_running();
  if (auto restarted = restart(); !restarted.ok()) {
    return common::Result<net::HttpResponse>::failure(
        "agent restart after proxy failure failed: " + restarted.error(), common::ErrorKind::Proxy,
        restarted.diagnostics());
  }

  response = sandbox.http_call(upstream, agent_.port);
  observability::record_proxy(request.tenant_id, request.path, response.status, true);
  if (!is_failure(response)) {
    return common::Result<net::HttpResponse>::success(std::move(response));
  }

  supervisor.clear_running();
  const auto diagnostics =
      sandbox::collect_diagnostics(sandbox, agent_.log_path).to_string();
  return common::Result<net::HttpResponse>::failure("agent request failed after restart: " +
                                                        describe(response),
                                                    common::ErrorKind::Proxy, diagnostics);
}

common::Result<StreamOutcome> RequestProxy::proxy_stream(sandbox::ISandbox &sandbox,
                                                         ProcessSupervisor &supervisor,
                                                         const ProxyRequest &request,
                                                         const StreamSink &sink) {
  StreamOutcome outcome;
  StreamEventScanner scanner;
  bool started = false;

  const auto on_chunk = [&](const std::uint16_t status, const std::string_view chunk) {
    if (!started) {
      started = true;
      outcome.status = status;
      if (!sink.begin(status)) {
        outcome.client_closed = true;
        return false;
      }
    }
    for (const auto &event : scanner.feed(chunk)) {
      if (event.type == StreamEventType::Error) {
        observability::record_error("stream", request.tenant_id + ": " + event.error);
      }
    }
    if (!sink.write(chunk)) {
      outcome.client_closed = true;
      return false;
    }
    return true;
  };

  const auto response = sandbox.http_stream(build_request(request), agent_.port, on_chunk);
  (void)scanner.finish();

  if (response.cancelled || outcome.client_closed) {
    outcome.client_closed = true;
    observability::record_notice("stream", "client disconnected from " + sandbox.name());
  } else if (response.failed()) {
    supervisor.clear_running();
    if (!started) {
      return common::Result<StreamOutcome>::failure("agent stream failed: " + describe(response),
                                                    common::ErrorKind::Proxy);
    }
    outcome.interrupted = true;
    (void)sink.write(stream_interrupted_line(describe(response)));
  } else if (!started) {
    outcome.status = response.status;
    if (!sink.begin(response.status)) {
      outcome.client_closed = true;
    }
  }

  if (outcome.status >= 500) {
    supervisor.clear_running();
  }
  outcome.tokens = scanner.total_tokens();
  if (outcome.tokens > 0) {
    observability::record_metric(observability::TokensUsedMetric{.tokens = outcome.tokens});
  }
  observability::record_proxy(request.tenant_id, request.path, outcome.status, false);
  return common::Result<StreamOutcome>::success(outcome);
}

common::Result<net::WebSocketTunnel>
RequestProxy::proxy_websocket(const std::string &tenant_id, const WebSocketAttempt &attempt) {
  std::string last_error = "no attempts made";
  for (int k = 0; k < kWebSocketAttempts; ++k) {
    if (k > 0 && !websocket_backoff_.empty()) {
      const auto index = std::min<std::size_t>(static_cast<std::size_t>(k - 1),
                                                websocket_backoff_.size() - 1);
      sleeper_(websocket_backoff_[index]);
    }
    auto tunnel = attempt(k);
    if (tunnel.ok()) {
      observability::record_proxy(tenant_id, "/ws/chat", 101, k > 0);
      return tunnel;
    }
    last_error = tunnel.error();
    observability::record_error("proxy", "websocket attempt " + std::to_string(k + 1) + " for " +
                                             tenant_id + " failed: " + last_error);
  }
  observability::record_proxy(tenant_id, "/ws/chat", 503, true);
  return common::Result<net::WebSocketTunnel>::failure(
      "Agent unavailable after " + std::to_string(kWebSocketAttempts) + " attempts: " + last_error,
      common::ErrorKind::Proxy);
}

} // namespace warden::tenant
