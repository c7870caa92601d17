#include "warden/net/websocket.hpp"

#include "warden/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace warden::net {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 16 * 1024;
constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string lower_trimmed(const std::string &value) {
  return common::to_lower(common::trim(value));
}

std::string base64_encode(const unsigned char *data, const std::size_t size) {
  const int output_len = 4 * static_cast<int>((size + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), data, static_cast<int>(size));
  return output;
}

bool wait_fd(const int fd, const short events, const std::chrono::milliseconds timeout) {
  pollfd pfd{.fd = fd, .events = events, .revents = 0};
  const int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
  return ready > 0 && (pfd.revents & (events | POLLHUP)) != 0;
}

} // namespace

void SocketHandle::reset() {
  if (fd_ >= 0) {
    shutdown(fd_, SHUT_RDWR);
    close(fd_);
    fd_ = -1;
  }
}

bool send_all(const int fd, const char *data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool send_all(const int fd, const std::string &data) { return send_all(fd, data.data(), data.size()); }

std::unordered_map<std::string, std::string> parse_headers(const std::string &head) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(head);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      headers[":start-line"] = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[lower_trimmed(line.substr(0, colon))] = common::trim(line.substr(colon + 1));
  }
  return headers;
}

std::string websocket_accept(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());
  return base64_encode(digest.data(), digest.size());
}

std::string generate_websocket_key() {
  std::array<unsigned char, 16> nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    for (std::size_t i = 0; i < nonce.size(); ++i) {
      nonce[i] = static_cast<unsigned char>(i * 37 + 11);
    }
  }
  return base64_encode(nonce.data(), nonce.size());
}

bool is_websocket_upgrade(const std::unordered_map<std::string, std::string> &headers) {
  const auto upgrade_it = headers.find("upgrade");
  const auto connection_it = headers.find("connection");
  const auto version_it = headers.find("sec-websocket-version");
  const auto key_it = headers.find("sec-websocket-key");
  return upgrade_it != headers.end() && connection_it != headers.end() &&
         version_it != headers.end() && key_it != headers.end() &&
         lower_trimmed(upgrade_it->second) == "websocket" &&
         common::to_lower(connection_it->second).find("upgrade") != std::string::npos &&
         common::trim(version_it->second) == "13" && !common::trim(key_it->second).empty();
}

bool send_frame(const int fd, const std::uint8_t opcode, const std::string &payload) {
  std::string frame;
  frame.reserve(payload.size() + 10);
  frame.push_back(static_cast<char>(0x80u | (opcode & 0x0Fu)));

  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<char>(size));
  } else if (size <= 65535u) {
    frame.push_back(static_cast<char>(126u));
    frame.push_back(static_cast<char>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<char>(size & 0xFFu));
  } else {
    frame.push_back(static_cast<char>(127u));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }

  frame += payload;
  return send_all(fd, frame);
}

common::Result<SocketHandle> connect_tcp(const std::string &host, const std::uint16_t port,
                                         const std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = nullptr;
  const std::string service = std::to_string(port);
  if (const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results); rc != 0) {
    return common::Result<SocketHandle>::failure("resolve " + host + ": " + gai_strerror(rc),
                                                 common::ErrorKind::Proxy);
  }

  std::string last_error = "no addresses for " + host;
  for (addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    SocketHandle socket_handle(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (!socket_handle.valid()) {
      last_error = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    const int fd = socket_handle.get();
    const int flags = fcntl(fd, F_GETFL, 0);
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      if (wait_fd(fd, POLLOUT, timeout)) {
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        rc = so_error == 0 ? 0 : -1;
        errno = so_error;
      } else {
        errno = ETIMEDOUT;
      }
    }
    if (rc != 0) {
      last_error = "connect " + host + ":" + service + ": " + std::strerror(errno);
      continue;
    }

    (void)fcntl(fd, F_SETFL, flags);
    freeaddrinfo(results);
    return common::Result<SocketHandle>::success(std::move(socket_handle));
  }

  freeaddrinfo(results);
  return common::Result<SocketHandle>::failure(last_error, common::ErrorKind::Proxy);
}

common::Result<WebSocketTunnel>
websocket_client_handshake(SocketHandle socket, const std::string &host, const std::uint16_t port,
                           const std::string &path,
                           const std::vector<std::pair<std::string, std::string>> &headers,
                           const std::chrono::milliseconds timeout) {
  using Failure = common::Result<WebSocketTunnel>;
  const std::string key = generate_websocket_key();

  std::ostringstream request;
  request << "GET " << (path.empty() ? "/" : path) << " HTTP/1.1\r\n";
  request << "Host: " << host << ":" << port << "\r\n";
  request << "Upgrade: websocket\r\n";
  request << "Connection: Upgrade\r\n";
  request << "Sec-WebSocket-Version: 13\r\n";
  request << "Sec-WebSocket-Key: " << key << "\r\n";
  for (const auto &[name, value] : headers) {
    request << name << ": " << value << "\r\n";
  }
  request << "\r\n";
  if (!send_all(socket.get(), request.str())) {
    return Failure::failure("failed to send websocket handshake", common::ErrorKind::Proxy);
  }

  std::string response;
  std::array<char, 2048> buf{};
  auto header_end = std::string::npos;
  while (header_end == std::string::npos && response.size() < kMaxHandshakeBytes) {
    if (!wait_fd(socket.get(), POLLIN, timeout)) {
      return Failure::failure("timed out waiting for websocket handshake",
                              common::ErrorKind::Proxy);
    }
    const ssize_t n = recv(socket.get(), buf.data(), buf.size(), 0);
    if (n <= 0) {
      return Failure::failure("upstream closed during websocket handshake",
                              common::ErrorKind::Proxy);
    }
    response.append(buf.data(), static_cast<std::size_t>(n));
    header_end = response.find("\r\n\r\n");
  }
  if (header_end == std::string::npos) {
    return Failure::failure("websocket handshake response too large", common::ErrorKind::Proxy);
  }

  const auto parsed = parse_headers(response.substr(0, header_end + 4));
  const auto status_line = parsed.find(":start-line");
  if (status_line == parsed.end() || status_line->second.find(" 101") == std::string::npos) {
    return Failure::failure("upstream refused websocket upgrade: " +
                                (status_line == parsed.end() ? std::string("no status line")
                                                             : status_line->second),
                            common::ErrorKind::Proxy);
  }
  const auto accept = parsed.find("sec-websocket-accept");
  if (accept == parsed.end() || common::trim(accept->second) != websocket_accept(key)) {
    return Failure::failure("upstream returned an invalid Sec-WebSocket-Accept",
                            common::ErrorKind::Proxy);
  }

  WebSocketTunnel tunnel;
  tunnel.socket = std::move(socket);
  tunnel.pending = response.substr(header_end + 4);
  return common::Result<WebSocketTunnel>::success(std::move(tunnel));
}

void relay_bidirectional(const int client_fd, const int upstream_fd) {
  std::array<char, 16 * 1024> buf{};
  pollfd fds[2] = {
      {.fd = client_fd, .events = POLLIN, .revents = 0},
      {.fd = upstream_fd, .events = POLLIN, .revents = 0},
  };
  while (true) {
    const int ready = poll(fds, 2, 1000);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    if (ready == 0) {
      continue;
    }
    for (int i = 0; i < 2; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t n = recv(fds[i].fd, buf.data(), buf.size(), 0);
      if (n <= 0) {
        return;
      }
      const int target = i == 0 ? upstream_fd : client_fd;
      if (!send_all(target, buf.data(), static_cast<std::size_t>(n))) {
        return;
      }
    }
  }
}

} // namespace warden::net
