#pragma once

#include "warden/config/schema.hpp"
#include "warden/sandbox/docker.hpp"
#include "warden/sandbox/sandbox.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace warden::sandbox {

/// A sandbox backed by one long-lived docker container. The agent is reached over
/// the container's bridge address.
class DockerSandbox final : public ISandbox {
public:
  DockerSandbox(std::string name, config::SandboxConfig config,
                std::shared_ptr<IDockerRunner> docker_runner,
                std::shared_ptr<net::HttpClient> http_client);

  [[nodiscard]] const std::string &name() const override { return name_; }
  [[nodiscard]] common::Status ensure_created() override;
  [[nodiscard]] common::Status mkdir(const std::string &path) override;
  [[nodiscard]] common::Status write_file(const std::string &path,
                                          const std::string &content) override;
  [[nodiscard]] common::Result<int> start_process(const ProcessSpec &spec) override;
  [[nodiscard]] net::HttpResponse http_call(const SandboxHttpRequest &request,
                                            std::uint16_t port) override;
  [[nodiscard]] net::HttpResponse http_stream(const SandboxHttpRequest &request,
                                              std::uint16_t port,
                                              const net::StreamChunkCallback &on_chunk) override;
  [[nodiscard]] common::Result<net::WebSocketTunnel> ws_connect(const SandboxHttpRequest &request,
                                                                std::uint16_t port) override;
  [[nodiscard]] common::Result<ExecResult> exec(const std::string &command) override;
  [[nodiscard]] common::Status destroy() override;

private:
  struct ContainerState {
    bool exists = false;
    bool running = false;
  };

  [[nodiscard]] common::Result<ContainerState> inspect_container_state();
  [[nodiscard]] common::Result<std::string> container_address();
  void forget_address();
  [[nodiscard]] DockerCommandOptions command_options(bool allow_failure = false) const;

  std::string name_;
  config::SandboxConfig config_;
  std::shared_ptr<IDockerRunner> docker_runner_;
  std::shared_ptr<net::HttpClient> http_client_;
  std::mutex address_mutex_;
  std::optional<std::string> address_;
};

class DockerSandboxProvider final : public ISandboxProvider {
public:
  DockerSandboxProvider(config::SandboxConfig config, std::shared_ptr<IDockerRunner> docker_runner,
                        std::shared_ptr<net::HttpClient> http_client);

  [[nodiscard]] std::shared_ptr<ISandbox> get_sandbox(const std::string &name) override;

private:
  config::SandboxConfig config_;
  std::shared_ptr<IDockerRunner> docker_runner_;
  std::shared_ptr<net::HttpClient> http_client_;
};

} // namespace warden::sandbox
