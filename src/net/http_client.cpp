#include "warden/net/http_client.hpp"

#include "warden/common/fs.hpp"

#include <curl/curl.h>

namespace warden::net {

namespace {

constexpr const char *USER_AGENT = "warden/0.1";

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

struct StreamWriteContext {
  CURL *curl = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
  bool cancelled = false;
};

size_t stream_write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<StreamWriteContext *>(userdata);
  if (context->on_chunk == nullptr || !*context->on_chunk) {
    return total;
  }
  long status = 0;
  curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);
  if (!(*context->on_chunk)(static_cast<std::uint16_t>(status), std::string_view(ptr, total))) {
    context->cancelled = true;
    return 0;
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<Headers *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

HttpResponse execute_request(const HttpRequest &request,
                             const StreamChunkCallback *on_chunk = nullptr) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  StreamWriteContext context{.curl = curl, .on_chunk = on_chunk};

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  if (on_chunk != nullptr) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  } else {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  }

  if (request.method == "HEAD") {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  } else if (request.method != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }
  if (request.body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : request.headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);

  if (context.cancelled) {
    response.cancelled = true;
  } else if (code == CURLE_OPERATION_TIMEDOUT) {
    response.timeout = true;
    response.network_error_message = curl_easy_strerror(code);
  } else if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

HttpResponse HttpClient::get(const std::string &url, const Headers &headers,
                             const std::chrono::milliseconds timeout) {
  return send(HttpRequest{.method = "GET", .url = url, .headers = headers, .timeout = timeout});
}

HttpResponse HttpClient::post_json(const std::string &url, const Headers &headers,
                                   const std::string &body,
                                   const std::chrono::milliseconds timeout) {
  Headers merged = headers;
  if (!merged.contains("Content-Type")) {
    merged["Content-Type"] = "application/json";
  }
  return send(HttpRequest{
      .method = "POST", .url = url, .headers = std::move(merged), .body = body, .timeout = timeout});
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::send(const HttpRequest &request) { return execute_request(request); }

HttpResponse CurlHttpClient::send_stream(const HttpRequest &request,
                                         const StreamChunkCallback &on_chunk) {
  return execute_request(request, &on_chunk);
}

} // namespace warden::net
