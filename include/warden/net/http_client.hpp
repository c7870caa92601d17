#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::net {

using Headers = std::unordered_map<std::string, std::string>;

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  Headers headers;
  std::optional<std::string> body;
  std::chrono::milliseconds timeout{30'000};
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// Keys are lowercased.
  Headers headers;
  bool timeout = false;
  bool network_error = false;
  bool cancelled = false;
  std::string network_error_message;

  [[nodiscard]] bool failed() const { return network_error || timeout || status == 0; }
};

/// Receives the response status with each body chunk as it arrives. Returning false
/// aborts the transfer and marks the response cancelled.
using StreamChunkCallback = std::function<bool(std::uint16_t status, std::string_view chunk)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request) = 0;
  /// Streamed bodies are delivered only through on_chunk; response.body stays empty.
  [[nodiscard]] virtual HttpResponse send_stream(const HttpRequest &request,
                                                 const StreamChunkCallback &on_chunk) = 0;

  [[nodiscard]] HttpResponse get(const std::string &url, const Headers &headers,
                                 std::chrono::milliseconds timeout);
  [[nodiscard]] HttpResponse post_json(const std::string &url, const Headers &headers,
                                       const std::string &body, std::chrono::milliseconds timeout);
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse send(const HttpRequest &request) override;
  [[nodiscard]] HttpResponse send_stream(const HttpRequest &request,
                                         const StreamChunkCallback &on_chunk) override;
};

} // namespace warden::net
