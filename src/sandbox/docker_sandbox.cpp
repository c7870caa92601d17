#include "warden/sandbox/docker_sandbox.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"

#include <charconv>

namespace warden::sandbox {

namespace {

std::string url_for(const std::string &address, const std::uint16_t port, const std::string &path) {
  return "http://" + address + ":" + std::to_string(port) + (path.empty() ? "/" : path);
}

net::HttpResponse address_failure(const std::string &message) {
  net::HttpResponse response;
  response.network_error = true;
  response.network_error_message = message;
  return response;
}

} // namespace

DockerSandbox::DockerSandbox(std::string name, config::SandboxConfig config,
                             std::shared_ptr<IDockerRunner> docker_runner,
                             std::shared_ptr<net::HttpClient> http_client)
    : name_(std::move(name)), config_(std::move(config)), docker_runner_(std::move(docker_runner)),
      http_client_(std::move(http_client)) {}

DockerCommandOptions DockerSandbox::command_options(const bool allow_failure) const {
  return DockerCommandOptions{.allow_failure = allow_failure, .timeout = config_.docker_timeout};
}

common::Result<DockerSandbox::ContainerState> DockerSandbox::inspect_container_state() {
  auto inspect = docker_runner_->run({"inspect", "-f", "{{.State.Running}}", name_},
                                     command_options(true));
  if (!inspect.ok()) {
    return common::Result<ContainerState>::failure(inspect.error(),
                                                   common::ErrorKind::SandboxProvision);
  }
  if (inspect.value().exit_code != 0) {
    return common::Result<ContainerState>::success(ContainerState{.exists = false, .running = false});
  }

  const auto state = common::to_lower(common::trim(inspect.value().stdout_text));
  return common::Result<ContainerState>::success(
      ContainerState{.exists = true, .running = state.find("true") != std::string::npos});
}

common::Status DockerSandbox::ensure_created() {
  auto state = inspect_container_state();
  if (!state.ok()) {
    return common::Status::from(state.details());
  }

  if (!state.value().exists) {
    auto create = docker_runner_->run(build_docker_create_args(config_, name_), command_options());
    if (!create.ok()) {
      return common::Status::error("create " + name_ + ": " + create.error(),
                                   common::ErrorKind::SandboxProvision);
    }
    observability::record_sandbox(name_, "create", true, "image=" + config_.image);
  }

  if (!state.value().exists || !state.value().running) {
    auto start = docker_runner_->run({"start", name_}, command_options());
    if (!start.ok()) {
      return common::Status::error("start " + name_ + ": " + start.error(),
                                   common::ErrorKind::SandboxProvision);
    }
    forget_address();
    observability::record_sandbox(name_, "start", true);
  }
  return common::Status::success();
}

common::Status DockerSandbox::mkdir(const std::string &path) {
  auto result = docker_runner_->run({"exec", name_, "mkdir", "-p", path}, command_options());
  if (!result.ok()) {
    return common::Status::error("mkdir " + path + ": " + result.error());
  }
  return common::Status::success();
}

common::Status DockerSandbox::write_file(const std::string &path, const std::string &content) {
  auto options = command_options();
  options.input = content;
  auto result = docker_runner_->run(
      {"exec", "-i", name_, "sh", "-c", "cat > " + common::shell_quote(path)}, options);
  if (!result.ok()) {
    return common::Status::error("write " + path + ": " + result.error());
  }
  return common::Status::success();
}

common::Result<int> DockerSandbox::start_process(const ProcessSpec &spec) {
  std::vector<std::string> args = {"exec"};
  if (!spec.cwd.empty()) {
    args.push_back("-w");
    args.push_back(spec.cwd);
  }
  // Values travel in the docker client's environment, never on its command line.
  for (const auto &[key, value] : spec.env) {
    args.push_back("-e");
    args.push_back(key);
  }
  args.push_back(name_);
  args.push_back("sh");
  args.push_back("-c");
  args.push_back(build_background_command(spec));

  auto options = command_options();
  options.env = spec.env;
  auto result = docker_runner_->run(args, options);
  if (!result.ok()) {
    return common::Result<int>::failure("start process: " + result.error(),
                                        common::ErrorKind::ColdStart);
  }

  const std::string pid_text = common::trim(result.value().stdout_text);
  int pid = 0;
  const auto [ptr, ec] = std::from_chars(pid_text.data(), pid_text.data() + pid_text.size(), pid);
  if (ec != std::errc() || pid <= 0) {
    return common::Result<int>::failure("start process: unexpected pid output '" + pid_text + "'",
                                        common::ErrorKind::ColdStart);
  }
  return common::Result<int>::success(pid);
}

common::Result<std::string> DockerSandbox::container_address() {
  {
    std::lock_guard<std::mutex> lock(address_mutex_);
    if (address_.has_value()) {
      return common::Result<std::string>::success(*address_);
    }
  }

  auto inspect = docker_runner_->run(
      {"inspect", "-f", "{{range .NetworkSettings.Networks}}{{.IPAddress}} {{end}}", name_},
      command_options(true));
  if (!inspect.ok()) {
    return common::Result<std::string>::failure(inspect.error(), common::ErrorKind::Proxy);
  }
  if (inspect.value().exit_code != 0) {
    return common::Result<std::string>::failure("sandbox " + name_ + " does not exist",
                                                common::ErrorKind::Proxy);
  }
  const auto addresses = common::split(common::trim(inspect.value().stdout_text), ' ');
  for (const auto &candidate : addresses) {
    const std::string address = common::trim(candidate);
    if (address.empty()) {
      continue;
    }
    std::lock_guard<std::mutex> lock(address_mutex_);
    address_ = address;
    return common::Result<std::string>::success(address);
  }
  return common::Result<std::string>::failure("sandbox " + name_ + " has no network address",
                                              common::ErrorKind::Proxy);
}

void DockerSandbox::forget_address() {
  std::lock_guard<std::mutex> lock(address_mutex_);
  address_.reset();
}

net::HttpResponse DockerSandbox::http_call(const SandboxHttpRequest &request,
                                           const std::uint16_t port) {
  auto address = container_address();
  if (!address.ok()) {
    return address_failure(address.error());
  }
  auto response = http_client_->send(net::HttpRequest{.method = request.method,
                                                      .url = url_for(address.value(), port, request.path),
                                                      .headers = request.headers,
                                                      .body = request.body,
                                                      .timeout = request.timeout});
  if (response.network_error) {
    forget_address();
  }
  return response;
}

net::HttpResponse DockerSandbox::http_stream(const SandboxHttpRequest &request,
                                             const std::uint16_t port,
                                             const net::StreamChunkCallback &on_chunk) {
  auto address = container_address();
  if (!address.ok()) {
    return address_failure(address.error());
  }
  auto response =
      http_client_->send_stream(net::HttpRequest{.method = request.method,
                                                 .url = url_for(address.value(), port, request.path),
                                                 .headers = request.headers,
                                                 .body = request.body,
                                                 .timeout = request.timeout},
                                on_chunk);
  if (response.network_error) {
    forget_address();
  }
  return response;
}

common::Result<net::WebSocketTunnel> DockerSandbox::ws_connect(const SandboxHttpRequest &request,
                                                               const std::uint16_t port) {
  auto address = container_address();
  if (!address.ok()) {
    return common::Result<net::WebSocketTunnel>::failure(address.details());
  }
  auto socket = net::connect_tcp(address.value(), port, request.timeout);
  if (!socket.ok()) {
    forget_address();
    return common::Result<net::WebSocketTunnel>::failure(socket.details());
  }
  std::vector<std::pair<std::string, std::string>> headers(request.headers.begin(),
                                                           request.headers.end());
  return net::websocket_client_handshake(std::move(socket.value()), address.value(), port,
                                         request.path, headers, request.timeout);
}

common::Result<ExecResult> DockerSandbox::exec(const std::string &command) {
  auto result = docker_runner_->run({"exec", name_, "sh", "-c", command}, command_options(true));
  if (!result.ok()) {
    return common::Result<ExecResult>::failure("exec: " + result.error());
  }
  return common::Result<ExecResult>::success(ExecResult{.exit_code = result.value().exit_code,
                                                        .stdout_text = result.value().stdout_text,
                                                        .stderr_text = result.value().stderr_text});
}

common::Status DockerSandbox::destroy() {
  auto removed = docker_runner_->run({"rm", "-f", name_}, command_options(true));
  forget_address();
  if (!removed.ok()) {
    return common::Status::error("destroy " + name_ + ": " + removed.error());
  }
  if (removed.value().exit_code != 0 &&
      removed.value().stderr_text.find("No such container") == std::string::npos) {
    return common::Status::error("destroy " + name_ + ": " + common::trim(removed.value().stderr_text));
  }
  observability::record_sandbox(name_, "destroy", true);
  return common::Status::success();
}

DockerSandboxProvider::DockerSandboxProvider(config::SandboxConfig config,
                                             std::shared_ptr<IDockerRunner> docker_runner,
                                             std::shared_ptr<net::HttpClient> http_client)
    : config_(std::move(config)), docker_runner_(std::move(docker_runner)),
      http_client_(std::move(http_client)) {}

std::shared_ptr<ISandbox> DockerSandboxProvider::get_sandbox(const std::string &name) {
  return std::make_shared<DockerSandbox>(name, config_, docker_runner_, http_client_);
}

} // namespace warden::sandbox
