#include "warden/gateway/server.hpp"

#include "warden/common/clock.hpp"
#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"
#include "warden/health/health.hpp"
#include "warden/net/websocket.hpp"
#include "warden/observability/global.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace warden::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr const char *kNdjson = "application/x-ndjson";

bool is_loopback_host(const std::string &host) {
  const std::string lowered = common::to_lower(common::trim(host));
  return lowered == "127.0.0.1" || lowered == "localhost" || lowered == "::1" ||
         lowered == "[::1]";
}

std::size_t parse_content_length(const std::string &value) {
  std::size_t length = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return 0;
  }
  return length;
}

HttpResponse from_reply(const tenant::ControllerReply &reply) {
  return make_json_response(reply.status, reply.body);
}

HttpResponse stream_failure_response(const common::Error &error) {
  if (error.kind == common::ErrorKind::Invalid) {
    return make_json_response(400, "{\"error\":" + common::json_string(error.message) + "}");
  }
  return from_reply(tenant::failure_reply(error));
}

bool is_chat_route(const std::string &path) {
  return path == "/chat" || path == "/chat/invocations";
}

} // namespace

GatewayServer::GatewayServer(const config::Config &config,
                             std::shared_ptr<tenant::ControllerRegistry> registry)
    : config_(config), registry_(std::move(registry)) {}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
  if (running_) {
    return common::Status::error("gateway already running");
  }
  if (auto bind_validation = validate_bind_address(options.host); !bind_validation.ok()) {
    return bind_validation;
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string host = options.host == "localhost" ? "127.0.0.1" : options.host;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host", common::ErrorKind::Invalid);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  health::mark_component_ok("gateway");
  observability::record_notice("gateway", "listening on " + options.host + ":" +
                                              std::to_string(bound_port_));
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
}

void GatewayServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  std::unique_lock<std::mutex> lock(clients_mutex_);
  for (const int fd : client_fds_) {
    shutdown(fd, SHUT_RDWR);
  }
  clients_cv_.wait(lock, [this]() { return client_fds_.empty(); });
  health::reset_component("gateway");
}

std::uint16_t GatewayServer::port() const { return bound_port_; }

bool GatewayServer::is_running() const { return running_.load(); }

common::Status GatewayServer::validate_bind_address(const std::string &host) const {
  if (!is_loopback_host(host) && !config_.gateway.allow_public_bind) {
    return common::Status::error("refusing public bind without allow_public_bind=true",
                                 common::ErrorKind::Invalid);
  }
  return common::Status::success();
}

std::optional<tenant::RequestContext> GatewayServer::request_context(const HttpRequest &request) {
  tenant::RequestContext context{
      .tenant_id = common::trim(header_lookup(request, "x-tenant-id")),
      .user_id = common::trim(header_lookup(request, "x-user-id")),
      .roles = common::trim(header_lookup(request, "x-user-roles")),
  };
  if (context.tenant_id.empty() || context.user_id.empty()) {
    return std::nullopt;
  }
  return context;
}

void GatewayServer::record_latency(const HttpRequest &request) const {
  const std::string start = header_lookup(request, "x-request-start");
  if (start.empty()) {
    return;
  }
  std::int64_t start_ms = 0;
  const auto [ptr, ec] = std::from_chars(start.data(), start.data() + start.size(), start_ms);
  if (ec != std::errc() || ptr != start.data() + start.size()) {
    return;
  }
  const auto now_ms = common::to_unix_ms(std::chrono::system_clock::now());
  if (now_ms >= start_ms) {
    observability::record_metric(observability::RequestLatencyMetric{
        .latency = std::chrono::milliseconds(now_ms - start_ms)});
  }
}

HttpResponse GatewayServer::dispatch_for_test(const HttpRequest &request) {
  auto response = dispatch(request);
  record_latency(request);
  return response;
}

HttpResponse GatewayServer::dispatch(const HttpRequest &request) {
  if (request.path == "/health") {
    if (request.method != "GET") {
      return make_json_response(405, R"({"error":"Method not allowed"})");
    }
    return handle_health();
  }

  const auto context = request_context(request);
  if (!context.has_value()) {
    return make_json_response(400, R"({"error":"Missing user context"})");
  }

  if (request.method == "POST" && is_chat_route(request.path)) {
    return handle_chat(request, *context);
  }
  if (request.method == "POST" && request.path == "/chat/stream") {
    return collect_stream(request, *context);
  }
  if (request.method == "GET" && request.path == "/ws/chat") {
    return make_json_response(426, R"({"error":"Expected WebSocket upgrade"})");
  }
  if (request.method == "GET" &&
      (request.path == "/sessions" || common::starts_with(request.path, "/sessions/"))) {
    return handle_sessions(request, *context);
  }
  return make_json_response(404, R"({"error":"Not found"})");
}

HttpResponse GatewayServer::handle_health() const {
  return make_json_response(200, health::snapshot_json());
}

HttpResponse GatewayServer::handle_chat(const HttpRequest &request,
                                        const tenant::RequestContext &context) {
  auto controller = registry_->for_tenant(context.tenant_id);
  return from_reply(controller->handle_chat(context, request.body));
}

HttpResponse GatewayServer::handle_sessions(const HttpRequest &request,
                                            const tenant::RequestContext &context) {
  auto controller = registry_->for_tenant(context.tenant_id);
  if (request.path == "/sessions") {
    return from_reply(controller->list_sessions(context));
  }
  const std::string id = common::url_decode(request.path.substr(std::strlen("/sessions/")));
  if (id.empty() || id.find('/') != std::string::npos) {
    return make_json_response(404, R"({"error":"Not found"})");
  }
  return from_reply(controller->get_session(context, id));
}

HttpResponse GatewayServer::collect_stream(const HttpRequest &request,
                                           const tenant::RequestContext &context) {
  HttpResponse response;
  response.content_type = kNdjson;
  response.headers["Cache-Control"] = "no-cache";
  const tenant::StreamSink sink{
      .begin =
          [&](const std::uint16_t status) {
            response.status = status;
            return true;
          },
      .write =
          [&](const std::string_view chunk) {
            response.body.append(chunk.data(), chunk.size());
            return true;
          },
  };

  auto controller = registry_->for_tenant(context.tenant_id);
  auto outcome = controller->handle_stream(context, request.body, sink);
  if (!outcome.ok()) {
    return stream_failure_response(outcome.details());
  }
  return response;
}

void GatewayServer::stream_to_client(const int client_fd, const HttpRequest &request,
                                     const tenant::RequestContext &context) {
  bool head_sent = false;
  const tenant::StreamSink sink{
      .begin =
          [&](const std::uint16_t status) {
            head_sent = true;
            return net::send_all(client_fd,
                                 render_chunked_head(status, kNdjson, {{"Cache-Control", "no-cache"}}));
          },
      .write =
          [&](const std::string_view chunk) {
            if (chunk.empty()) {
              return true;
            }
            return net::send_all(client_fd, render_chunk(chunk));
          },
  };

  auto controller = registry_->for_tenant(context.tenant_id);
  auto outcome = controller->handle_stream(context, request.body, sink);
  if (!outcome.ok()) {
    if (!head_sent) {
      (void)net::send_all(client_fd, render_http_response(stream_failure_response(outcome.details())));
    }
    return;
  }
  if (!outcome.value().client_closed) {
    (void)net::send_all(client_fd, render_last_chunk());
  }
}

void GatewayServer::tunnel_websocket(const int client_fd, const HttpRequest &request,
                                     const tenant::RequestContext &context) {
  if (!net::is_websocket_upgrade(request.headers)) {
    (void)net::send_all(client_fd, render_http_response(make_json_response(
                                       426, R"({"error":"Expected WebSocket upgrade"})")));
    return;
  }

  auto controller = registry_->for_tenant(context.tenant_id);
  auto tunnel = controller->handle_websocket(context, request.raw_path);
  if (!tunnel.ok()) {
    (void)net::send_all(client_fd, render_http_response(
                                       make_json_response(503, R"({"error":"Agent unavailable"})")));
    return;
  }

  const std::string handshake =
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Accept: " +
      net::websocket_accept(header_lookup(request, "sec-websocket-key")) + "\r\n\r\n";
  if (!net::send_all(client_fd, handshake)) {
    return;
  }
  auto &upstream = tunnel.value();
  if (!upstream.pending.empty() && !net::send_all(client_fd, upstream.pending)) {
    return;
  }
  net::relay_bidirectional(client_fd, upstream.socket.get());
  observability::record_notice("gateway", "websocket tunnel for " + context.tenant_id + " closed");
}

void GatewayServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      client_fds_.insert(client);
    }
    std::thread([this, client]() {
      handle_client(client);
      close(client);
      std::lock_guard<std::mutex> lock(clients_mutex_);
      client_fds_.erase(client);
      clients_cv_.notify_all();
    }).detach();
  }
}

void GatewayServer::handle_client(const int client_fd) {
  const std::size_t max_body = config_.gateway.max_body_bytes;
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  bool header_parsed = false;
  while (raw.size() < max_body + 8192) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    const auto header_end = raw.find("\r\n\r\n");
    if (!header_parsed && header_end != std::string::npos) {
      header_parsed = true;
      auto head = parse_http_request(raw.substr(0, header_end + 4));
      if (head.ok()) {
        content_length = parse_content_length(header_lookup(head.value(), "content-length"));
      }
      if (content_length > max_body) {
        (void)net::send_all(client_fd, render_http_response(make_json_response(
                                           413, R"({"error":"Request too large"})")));
        return;
      }
    }
    if (header_parsed && raw.size() >= header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  if (!parsed.ok()) {
    (void)net::send_all(client_fd, render_http_response(
                                       make_json_response(400, R"({"error":"Invalid request"})")));
    return;
  }
  const HttpRequest &request = parsed.value();
  const auto context = request_context(request);

  if (context.has_value() && request.method == "POST" && request.path == "/chat/stream") {
    stream_to_client(client_fd, request, *context);
  } else if (context.has_value() && request.method == "GET" && request.path == "/ws/chat") {
    tunnel_websocket(client_fd, request, *context);
  } else {
    (void)net::send_all(client_fd, render_http_response(dispatch(request)));
  }
  record_latency(request);
}

} // namespace warden::gateway
