#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/net/http_client.hpp"
#include "warden/net/websocket.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::sandbox {

using EnvList = std::vector<std::pair<std::string, std::string>>;

struct ProcessSpec {
  std::string command;
  std::string cwd;
  EnvList env;
};

struct ExecResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// A request addressed to a port inside the sandbox; `path` includes any query.
struct SandboxHttpRequest {
  std::string method = "GET";
  std::string path = "/";
  net::Headers headers;
  std::optional<std::string> body;
  std::chrono::milliseconds timeout{30'000};
};

/// Handle on one tenant's isolated environment. Creating a handle is free; nothing
/// exists on the host until ensure_created() succeeds.
class ISandbox {
public:
  virtual ~ISandbox() = default;

  [[nodiscard]] virtual const std::string &name() const = 0;
  /// Creates or resumes the environment. Idempotent.
  [[nodiscard]] virtual common::Status ensure_created() = 0;
  [[nodiscard]] virtual common::Status mkdir(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status write_file(const std::string &path,
                                                  const std::string &content) = 0;
  [[nodiscard]] virtual common::Result<int> start_process(const ProcessSpec &spec) = 0;
  [[nodiscard]] virtual net::HttpResponse http_call(const SandboxHttpRequest &request,
                                                    std::uint16_t port) = 0;
  [[nodiscard]] virtual net::HttpResponse http_stream(const SandboxHttpRequest &request,
                                                      std::uint16_t port,
                                                      const net::StreamChunkCallback &on_chunk) = 0;
  [[nodiscard]] virtual common::Result<net::WebSocketTunnel>
  ws_connect(const SandboxHttpRequest &request, std::uint16_t port) = 0;
  /// Runs a shell command; used for diagnostics and log reads.
  [[nodiscard]] virtual common::Result<ExecResult> exec(const std::string &command) = 0;
  [[nodiscard]] virtual common::Status destroy() = 0;
};

class ISandboxProvider {
public:
  virtual ~ISandboxProvider() = default;
  /// Returns a handle for the deterministic name; repeated calls address the same
  /// environment.
  [[nodiscard]] virtual std::shared_ptr<ISandbox> get_sandbox(const std::string &name) = 0;
};

/// `<prefix><tenant>` for ids of letters, digits, '_' and '-' up to 64 characters;
/// any other id becomes `<prefix>h.<sha256 prefix>`. Distinct ids never share a name.
[[nodiscard]] std::string sandbox_name_for_tenant(const std::string &prefix,
                                                  const std::string &tenant_id);
/// The tenant id of a verbatim name; hashed names cannot be reversed.
[[nodiscard]] std::optional<std::string> tenant_from_sandbox_name(const std::string &prefix,
                                                                  const std::string &name);

[[nodiscard]] std::vector<std::string> build_docker_create_args(const config::SandboxConfig &config,
                                                                const std::string &name);
[[nodiscard]] std::string build_background_command(const ProcessSpec &spec);

} // namespace warden::sandbox
