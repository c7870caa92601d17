#pragma once

#include "warden/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden::net {

constexpr std::uint8_t WS_OPCODE_TEXT = 0x1;
constexpr std::uint8_t WS_OPCODE_CLOSE = 0x8;

/// Owns a socket descriptor; closed on destruction.
class SocketHandle {
public:
  SocketHandle() = default;
  explicit SocketHandle(int fd) : fd_(fd) {}
  ~SocketHandle() { reset(); }

  SocketHandle(const SocketHandle &) = delete;
  SocketHandle &operator=(const SocketHandle &) = delete;
  SocketHandle(SocketHandle &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  SocketHandle &operator=(SocketHandle &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }
  void reset();

private:
  int fd_ = -1;
};

/// An upgraded upstream connection. `pending` holds bytes the upstream sent right
/// after its 101 response, which belong to the client.
struct WebSocketTunnel {
  SocketHandle socket;
  std::string pending;
};

[[nodiscard]] bool send_all(int fd, const char *data, std::size_t size);
[[nodiscard]] bool send_all(int fd, const std::string &data);

/// Parses an HTTP head; the request/status line is stored under ":start-line",
/// other keys are lowercased.
[[nodiscard]] std::unordered_map<std::string, std::string> parse_headers(const std::string &head);

/// Sec-WebSocket-Accept for a client key (RFC 6455 section 4.2.2).
[[nodiscard]] std::string websocket_accept(const std::string &client_key);
[[nodiscard]] std::string generate_websocket_key();

/// True when the headers carry a well-formed version-13 upgrade request.
[[nodiscard]] bool is_websocket_upgrade(const std::unordered_map<std::string, std::string> &headers);

[[nodiscard]] bool send_frame(int fd, std::uint8_t opcode, const std::string &payload);

[[nodiscard]] common::Result<SocketHandle> connect_tcp(const std::string &host, std::uint16_t port,
                                                       std::chrono::milliseconds timeout);

/// Performs the client side of the opening handshake on a connected socket.
[[nodiscard]] common::Result<WebSocketTunnel>
websocket_client_handshake(SocketHandle socket, const std::string &host, std::uint16_t port,
                           const std::string &path,
                           const std::vector<std::pair<std::string, std::string>> &headers,
                           std::chrono::milliseconds timeout);

/// Copies bytes in both directions until either side closes.
void relay_bidirectional(int client_fd, int upstream_fd);

} // namespace warden::net
