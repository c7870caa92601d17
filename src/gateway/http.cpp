#include "warden/gateway/http.hpp"

#include "warden/common/fs.hpp"

#include <cstdio>
#include <sstream>

namespace warden::gateway {

std::string status_text(const int status) {
  switch (status) {
  case 101:
    return "Switching Protocols";
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 426:
    return "Upgrade Required";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  default:
    return "OK";
  }
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[common::url_decode(part)] = "";
      continue;
    }
    out[common::url_decode(part.substr(0, eq))] = common::url_decode(part.substr(eq + 1));
  }
  return out;
}

HttpResponse make_json_response(const int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const auto it = request.headers.find(common::to_lower(key));
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

std::string render_chunked_head(const int status, const std::string &content_type,
                                const std::unordered_map<std::string, std::string> &headers) {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
  out << "Content-Type: " << content_type << "\r\n";
  out << "Transfer-Encoding: chunked\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  return out.str();
}

std::string render_chunk(const std::string_view data) {
  if (data.empty()) {
    return "";
  }
  char size[32];
  std::snprintf(size, sizeof(size), "%zx\r\n", data.size());
  std::string out(size);
  out.append(data.data(), data.size());
  out += "\r\n";
  return out;
}

std::string render_last_chunk() { return "0\r\n\r\n"; }

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request", common::ErrorKind::Invalid);
  }

  const std::string headers_part = raw.substr(0, header_end);
  const std::string body = raw.substr(header_end + 4);

  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line", common::ErrorKind::Invalid);
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure("invalid request line", common::ErrorKind::Invalid);
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = body;
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }
  return common::Result<HttpRequest>::success(std::move(request));
}

} // namespace warden::gateway
