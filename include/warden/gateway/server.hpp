#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/gateway/http.hpp"
#include "warden/tenant/controller.hpp"
#include "warden/tenant/registry.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace warden::gateway {

struct GatewayOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8787;
};

/// HTTP/1.1 front door. Each connection gets its own thread so one tenant's stream or
/// WebSocket tunnel never holds up another tenant.
class GatewayServer {
public:
  GatewayServer(const config::Config &config, std::shared_ptr<tenant::ControllerRegistry> registry);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  /// Routes a fully-read request. Streams are collected into the body; WebSocket
  /// upgrades are only served on a live connection.
  [[nodiscard]] HttpResponse dispatch_for_test(const HttpRequest &request);

private:
  [[nodiscard]] common::Status validate_bind_address(const std::string &host) const;
  [[nodiscard]] static std::optional<tenant::RequestContext> request_context(const HttpRequest &request);

  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_health() const;
  [[nodiscard]] HttpResponse handle_chat(const HttpRequest &request,
                                         const tenant::RequestContext &context);
  [[nodiscard]] HttpResponse handle_sessions(const HttpRequest &request,
                                             const tenant::RequestContext &context);
  [[nodiscard]] HttpResponse collect_stream(const HttpRequest &request,
                                            const tenant::RequestContext &context);

  void stream_to_client(int client_fd, const HttpRequest &request,
                        const tenant::RequestContext &context);
  void tunnel_websocket(int client_fd, const HttpRequest &request,
                        const tenant::RequestContext &context);

  void accept_loop();
  void handle_client(int client_fd);
  void record_latency(const HttpRequest &request) const;

  const config::Config &config_;
  std::shared_ptr<tenant::ControllerRegistry> registry_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;

  std::mutex clients_mutex_;
  std::condition_variable clients_cv_;
  std::set<int> client_fds_;
};

} // namespace warden::gateway
