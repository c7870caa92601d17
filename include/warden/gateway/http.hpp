#pragma once

#include "warden/common/result.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::gateway {

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  /// Keys are lowercased.
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::unordered_map<std::string, std::string> parse_query_string(const std::string &query);

[[nodiscard]] std::string status_text(int status);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);
/// Status line and headers for a chunked response; the body follows as chunks.
[[nodiscard]] std::string render_chunked_head(int status, const std::string &content_type,
                                              const std::unordered_map<std::string, std::string> &headers);
[[nodiscard]] std::string render_chunk(std::string_view data);
/// The zero-length chunk that ends a chunked body.
[[nodiscard]] std::string render_last_chunk();

[[nodiscard]] HttpResponse make_json_response(int status, const std::string &body);
[[nodiscard]] std::string header_lookup(const HttpRequest &request, const std::string &key);

} // namespace warden::gateway
