#include "warden/sandbox/docker.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace warden::sandbox {

namespace {

struct Pipe {
  int read_fd = -1;
  int write_fd = -1;

  void close_read() {
    if (read_fd >= 0) {
      close(read_fd);
      read_fd = -1;
    }
  }
  void close_write() {
    if (write_fd >= 0) {
      close(write_fd);
      write_fd = -1;
    }
  }
  void close_both() {
    close_read();
    close_write();
  }
};

bool open_pipe(Pipe &p) {
  int fds[2] = {-1, -1};
  if (pipe(fds) != 0) {
    return false;
  }
  p.read_fd = fds[0];
  p.write_fd = fds[1];
  return true;
}

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

// Pushes as much pending input as the pipe accepts; closes it once drained.
void pump_input(Pipe &stdin_pipe, const std::string &input, std::size_t &written) {
  if (stdin_pipe.write_fd < 0) {
    return;
  }
  while (written < input.size()) {
    const ssize_t bytes = write(stdin_pipe.write_fd, input.data() + written, input.size() - written);
    if (bytes > 0) {
      written += static_cast<std::size_t>(bytes);
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    // EPIPE: the child stopped reading.
    break;
  }
  stdin_pipe.close_write();
}

std::vector<std::string>
child_environment(const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> out;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string text(*entry);
    const std::string name = text.substr(0, text.find('='));
    const bool replaced = std::any_of(overrides.begin(), overrides.end(),
                                      [&name](const auto &item) { return item.first == name; });
    if (!replaced) {
      out.push_back(text);
    }
  }
  for (const auto &[name, value] : overrides) {
    out.push_back(name + "=" + value);
  }
  return out;
}

} // namespace

std::string describe_docker_args(const std::vector<std::string> &args) {
  std::string out;
  bool env_value = false;
  for (const auto &arg : args) {
    std::string shown = arg;
    if (env_value) {
      shown = arg.substr(0, arg.find('='));
    } else if (arg.rfind("--env=", 0) == 0) {
      shown = "--env=" + arg.substr(6, arg.find('=', 6) - 6);
    }
    env_value = arg == "-e" || arg == "--env";
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += shown;
  }
  return out;
}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure("docker command is empty");
  }

  Pipe stdin_pipe;
  Pipe stdout_pipe;
  Pipe stderr_pipe;
  if (!open_pipe(stdin_pipe) || !open_pipe(stdout_pipe) || !open_pipe(stderr_pipe)) {
    stdin_pipe.close_both();
    stdout_pipe.close_both();
    stderr_pipe.close_both();
    return common::Result<DockerProcessResult>::failure("failed to create pipes for docker");
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>("docker"));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const std::vector<std::string> environment =
      options.env.empty() ? std::vector<std::string>{} : child_environment(options.env);
  std::vector<char *> envp;
  if (!environment.empty()) {
    envp.reserve(environment.size() + 1);
    for (const auto &entry : environment) {
      envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    stdin_pipe.close_both();
    stdout_pipe.close_both();
    stderr_pipe.close_both();
    return common::Result<DockerProcessResult>::failure("failed to fork docker process");
  }

  if (pid == 0) {
    (void)dup2(stdin_pipe.read_fd, STDIN_FILENO);
    (void)dup2(stdout_pipe.write_fd, STDOUT_FILENO);
    (void)dup2(stderr_pipe.write_fd, STDERR_FILENO);
    stdin_pipe.close_both();
    stdout_pipe.close_both();
    stderr_pipe.close_both();

    if (envp.empty()) {
      execvp("docker", argv.data());
    } else {
      execvpe("docker", argv.data(), envp.data());
    }
    _exit(127);
  }

  stdin_pipe.close_read();
  stdout_pipe.close_write();
  stderr_pipe.close_write();
  set_non_blocking(stdout_pipe.read_fd);
  set_non_blocking(stderr_pipe.read_fd);

  const std::string input = options.input.value_or("");
  std::size_t input_written = 0;
  if (input.empty()) {
    stdin_pipe.close_write();
  } else {
    set_non_blocking(stdin_pipe.write_fd);
  }

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    pump_input(stdin_pipe, input, input_written);
    read_into_buffer(stdout_pipe.read_fd, stdout_text);
    read_into_buffer(stderr_pipe.read_fd, stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe.read_fd, .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe.read_fd, .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(stdout_pipe.read_fd, stdout_text);
  read_into_buffer(stderr_pipe.read_fd, stderr_text);
  stdin_pipe.close_write();
  stdout_pipe.close_read();
  stderr_pipe.close_read();

  DockerProcessResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  if (timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<DockerProcessResult>::failure("docker command timed out: " +
                                                           describe_docker_args(args));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + describe_docker_args(args)
                                    : result.stderr_text;
    return common::Result<DockerProcessResult>::failure(message);
  }

  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace warden::sandbox
