#pragma once

#include "warden/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::sandbox {

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  /// Written to the child's stdin, which is then closed.
  std::optional<std::string> input;
  /// Added to the docker client's own environment. With `-e NAME` this hands values
  /// to a container without putting them on the command line.
  std::vector<std::pair<std::string, std::string>> env;
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// The command line as error text may show it: `-e NAME=value` becomes `-e NAME`.
[[nodiscard]] std::string describe_docker_args(const std::vector<std::string> &args);

class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;
};

} // namespace warden::sandbox
