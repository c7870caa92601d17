#include "test_framework.hpp"

#include "warden/common/fs.hpp"
#include "warden/sandbox/diagnostics.hpp"
#include "warden/sandbox/docker_sandbox.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace {

namespace sb = warden::sandbox;
namespace wt = warden::testing;
using warden::common::Result;

bool contains_arg(const std::vector<std::string> &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

Result<sb::DockerProcessResult> exited(const int code, std::string out = "", std::string err = "") {
  return Result<sb::DockerProcessResult>::success(
      sb::DockerProcessResult{.exit_code = code, .stdout_text = std::move(out), .stderr_text = std::move(err)});
}

/// Puts `dir` first on PATH for the lifetime of the object.
class PathOverride {
public:
  explicit PathOverride(const std::string &dir) {
    const char *current = std::getenv("PATH");
    previous_ = current == nullptr ? "" : current;
    const std::string updated = previous_.empty() ? dir : dir + ":" + previous_;
    ::setenv("PATH", updated.c_str(), 1);
  }
  ~PathOverride() { ::setenv("PATH", previous_.c_str(), 1); }

  PathOverride(const PathOverride &) = delete;
  PathOverride &operator=(const PathOverride &) = delete;

private:
  std::string previous_;
};

struct DockerFixture {
  std::shared_ptr<wt::FakeDockerRunner> runner = std::make_shared<wt::FakeDockerRunner>();
  std::shared_ptr<wt::FakeHttpClient> http = std::make_shared<wt::FakeHttpClient>();
  warden::config::SandboxConfig config;

  sb::DockerSandbox make(const std::string &name = "tenant-acme") {
    return sb::DockerSandbox(name, config, runner, http);
  }
};

} // namespace

void register_sandbox_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;

  tests.push_back({"sandbox_name_is_deterministic", [] {
                     require(sb::sandbox_name_for_tenant("tenant-", "acme") == "tenant-acme",
                             "plain tenant mismatch");
                     require(sb::sandbox_name_for_tenant("tenant-", "Acme_Corp-EU") ==
                                 "tenant-Acme_Corp-EU",
                             "safe ids are kept verbatim");
                     const auto hashed = sb::sandbox_name_for_tenant("tenant-", "Acme Corp/EU");
                     require(hashed == sb::sandbox_name_for_tenant("tenant-", "Acme Corp/EU"),
                             "same tenant should map to the same name");
                     require(hashed.rfind("tenant-h.", 0) == 0 && hashed.size() == 9 + 32,
                             "unsafe ids are hashed: " + hashed);
                     require(hashed.find_first_not_of("tenant-h.0123456789abcdef") == std::string::npos,
                             "hashed name should be lowercase hex: " + hashed);
                   }});

  tests.push_back({"sandbox_names_never_collide", [] {
                     const std::vector<std::string> ids = {
                         "acme-corp", "acme/corp", "acme.corp", "acme corp", " acme-corp",
                         "", " ", "h.x", std::string(64, 'a'), std::string(65, 'a'),
                         std::string(200, 'a') + "1", std::string(200, 'a') + "2"};
                     std::set<std::string> names;
                     for (const auto &id : ids) {
                       names.insert(sb::sandbox_name_for_tenant("tenant-", id));
                     }
                     require(names.size() == ids.size(), "distinct tenants must get distinct names");
                     require(sb::sandbox_name_for_tenant("tenant-", std::string(64, 'a')) ==
                                 "tenant-" + std::string(64, 'a'),
                             "64 safe characters stay verbatim");
                   }});

  tests.push_back({"tenant_recovered_from_verbatim_sandbox_name", [] {
                     require(sb::tenant_from_sandbox_name("tenant-", "tenant-acme") ==
                                 std::optional<std::string>("acme"),
                             "prefix should be stripped");
                     require(!sb::tenant_from_sandbox_name("tenant-", "other-acme").has_value(),
                             "foreign names are not tenants");
                     require(!sb::tenant_from_sandbox_name("tenant-", "tenant-").has_value(),
                             "bare prefix has no tenant");
                     require(!sb::tenant_from_sandbox_name(
                                  "tenant-", sb::sandbox_name_for_tenant("tenant-", "acme/corp"))
                                  .has_value(),
                             "hashed names cannot be reversed");
                   }});

  tests.push_back({"docker_create_args_apply_limits", [] {
                     warden::config::SandboxConfig config;
                     config.image = "agent:1";
                     config.memory_limit = "512m";
                     config.cpu_limit = 0.5;
                     config.pids_limit = 128;
                     const auto args = sb::build_docker_create_args(config, "tenant-acme");
                     require(args.front() == "create", "first arg should be create");
                     require(contains_arg(args, "--memory") && contains_arg(args, "512m"),
                             "memory limit missing");
                     require(contains_arg(args, "--cpus") && contains_arg(args, "0.50"),
                             "cpu limit missing");
                     require(contains_arg(args, "--pids-limit") && contains_arg(args, "128"),
                             "pids limit missing");
                     require(contains_arg(args, "warden.name=tenant-acme"), "name label missing");
                     require(args[args.size() - 3] == "agent:1", "image should precede the command");
                     require(args.back() == "infinity", "container should idle forever");
                   }});

  tests.push_back({"background_command_detaches_and_reports_pid", [] {
                     const auto command =
                         sb::build_background_command(sb::ProcessSpec{.command = "node index.js"});
                     require(warden::common::starts_with(command, "nohup node index.js"),
                             "command should be wrapped in nohup");
                     require(warden::common::ends_with(command, "& echo $!"), "pid should be echoed");
                   }});

  tests.push_back({"ensure_created_creates_and_starts_missing_container", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &args) {
                       if (args.front() == "inspect") {
                         return exited(1, "", "Error: No such object: tenant-acme");
                       }
                       return exited(0, "ok");
                     };
                     auto sandbox = fixture.make();
                     const auto status = sandbox.ensure_created();
                     require(status.ok(), status.error());
                     require(fixture.runner->calls.size() == 3, "expected inspect, create, start");
                     require(fixture.runner->calls[1].front() == "create", "second call should create");
                     require(fixture.runner->calls[2] == std::vector<std::string>{"start", "tenant-acme"},
                             "third call should start");
                   }});

  tests.push_back({"ensure_created_is_idempotent_for_running_container", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &) {
                       return exited(0, "true\n");
                     };
                     auto sandbox = fixture.make();
                     require(sandbox.ensure_created().ok(), "first ensure should succeed");
                     require(sandbox.ensure_created().ok(), "second ensure should succeed");
                     require(fixture.runner->calls.size() == 2, "only inspects should run");
                   }});

  tests.push_back({"ensure_created_starts_stopped_container", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &) {
                       return exited(0, "false\n");
                     };
                     auto sandbox = fixture.make();
                     require(sandbox.ensure_created().ok(), "ensure should succeed");
                     require(fixture.runner->calls.size() == 2, "expected inspect and start");
                     require(fixture.runner->calls[1].front() == "start", "stopped container should start");
                   }});

  tests.push_back({"create_failure_is_a_provisioning_error", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &args) {
                       if (args.front() == "inspect") {
                         return exited(1);
                       }
                       return exited(125, "", "image not found");
                     };
                     auto sandbox = fixture.make();
                     const auto status = sandbox.ensure_created();
                     require(!status.ok(), "create failure should surface");
                     require(status.kind() == warden::common::ErrorKind::SandboxProvision,
                             "kind should be sandbox provisioning");
                     require(status.error().find("image not found") != std::string::npos,
                             "docker stderr should be kept");
                   }});

  tests.push_back({"write_file_pipes_content_through_stdin", [] {
                     DockerFixture fixture;
                     auto sandbox = fixture.make();
                     require(sandbox.write_file("/app/config/connectors.json", "[]\n").ok(),
                             "write should succeed");
                     const auto &args = fixture.runner->calls.back();
                     require(contains_arg(args, "-i"), "stdin should be attached");
                     require(args.back() == "cat > '/app/config/connectors.json'",
                             "target path should be quoted");
                     require(fixture.runner->options.back().input == std::optional<std::string>("[]\n"),
                             "content should be passed as input");
                   }});

  tests.push_back({"start_process_passes_env_and_parses_pid", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &) {
                       return exited(0, "314\n");
                     };
                     auto sandbox = fixture.make();
                     const auto pid = sandbox.start_process(sb::ProcessSpec{
                         .command = "node index.js", .cwd = "/app", .env = {{"PORT", "8080"}}});
                     require(pid.ok(), pid.error());
                     require(pid.value() == 314, "pid mismatch");
                     const auto &args = fixture.runner->calls.back();
                     require(contains_arg(args, "PORT"), "env name should be forwarded");
                     require(!contains_arg(args, "PORT=8080"), "env value stays off the command line");
                     const auto &env = fixture.runner->options.back().env;
                     require(env.size() == 1 && env.front().first == "PORT" && env.front().second == "8080",
                             "env value should travel in the client environment");
                     require(contains_arg(args, "/app"), "workdir should be forwarded");
                   }});

  tests.push_back({"docker_command_description_hides_env_values", [] {
                     const auto text = sb::describe_docker_args(
                         {"exec", "-w", "/app", "-e", "ANTHROPIC_API_KEY=sk-ant-SECRET123", "--env",
                          "AWS_SESSION_TOKEN=tok", "--env=AWS_SECRET_ACCESS_KEY=aws-secret", "-e",
                          "PORT", "tenant-acme", "sh", "-c", "echo hi"});
                     require(text == "exec -w /app -e ANTHROPIC_API_KEY --env AWS_SESSION_TOKEN "
                                     "--env=AWS_SECRET_ACCESS_KEY -e PORT tenant-acme sh -c echo hi",
                             "description mismatch: " + text);
                   }});

  tests.push_back({"failed_agent_launch_error_carries_no_credentials", [] {
                     const wt::TempWorkspace workspace;
                     workspace.create_file("docker", "#!/bin/sh\nexit 1\n");
                     std::filesystem::permissions(workspace.path() / "docker",
                                                  std::filesystem::perms::owner_all);
                     const PathOverride path(workspace.path().string());

                     warden::config::SandboxConfig config;
                     sb::DockerSandbox sandbox("tenant-acme", config,
                                               std::make_shared<sb::DockerCliRunner>(),
                                               std::make_shared<wt::FakeHttpClient>());
                     const auto pid = sandbox.start_process(sb::ProcessSpec{
                         .command = "node index.js",
                         .cwd = "/app",
                         .env = {{"ANTHROPIC_API_KEY", "sk-ant-SECRET123"},
                                 {"AWS_SECRET_ACCESS_KEY", "aws-secret-value"}}});
                     require(!pid.ok(), "a failing docker exec should fail the launch");
                     require(pid.error().find("sk-ant-SECRET123") == std::string::npos &&
                                 pid.error().find("aws-secret-value") == std::string::npos,
                             "launch error leaks a credential: " + pid.error());
                     require(pid.error().find("ANTHROPIC_API_KEY") != std::string::npos,
                             "the variable name is still reported: " + pid.error());
                   }});

  tests.push_back({"docker_runner_hands_env_to_the_client", [] {
                     const wt::TempWorkspace workspace;
                     workspace.create_file("docker", "#!/bin/sh\nprintf '%s' \"$WARDEN_TEST_SECRET\"\n");
                     std::filesystem::permissions(workspace.path() / "docker",
                                                  std::filesystem::perms::owner_all);
                     const PathOverride path(workspace.path().string());

                     sb::DockerCliRunner runner;
                     sb::DockerCommandOptions options;
                     options.env = {{"WARDEN_TEST_SECRET", "hunter2"}};
                     const auto result = runner.run({"exec", "-e", "WARDEN_TEST_SECRET", "box"}, options);
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().stdout_text == "hunter2",
                             "client should see the value: " + result.value().stdout_text);
                   }});

  tests.push_back({"start_process_rejects_garbage_pid", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &) {
                       return exited(0, "sh: node: not found\n");
                     };
                     auto sandbox = fixture.make();
                     const auto pid = sandbox.start_process(sb::ProcessSpec{.command = "node"});
                     require(!pid.ok(), "non-numeric output should fail");
                     require(pid.kind() == warden::common::ErrorKind::ColdStart, "kind should be cold start");
                   }});

  tests.push_back({"http_call_targets_container_address", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &) {
                       return exited(0, "172.17.0.5 \n");
                     };
                     auto sandbox = fixture.make();
                     const auto response = sandbox.http_call(
                         sb::SandboxHttpRequest{.method = "GET", .path = "/health"}, 8080);
                     require(response.status == 200, "fake client should answer 200");
                     require(fixture.http->requests.back().url == "http://172.17.0.5:8080/health",
                             "url mismatch: " + fixture.http->requests.back().url);
                     (void)sandbox.http_call(sb::SandboxHttpRequest{.path = "/chat"}, 8080);
                     require(fixture.runner->calls.size() == 1, "address should be cached");
                   }});

  tests.push_back({"destroy_tolerates_missing_container", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &) {
                       return exited(1, "", "Error: No such container: tenant-acme");
                     };
                     auto sandbox = fixture.make();
                     const auto status = sandbox.destroy();
                     require(status.ok(), status.error());
                     require(fixture.runner->calls.back() ==
                                 std::vector<std::string>{"rm", "-f", "tenant-acme"},
                             "destroy should force-remove");
                   }});

  tests.push_back({"destroy_reports_other_failures", [] {
                     DockerFixture fixture;
                     fixture.runner->responder = [](const std::vector<std::string> &) {
                       return exited(1, "", "removal already in progress");
                     };
                     auto sandbox = fixture.make();
                     require(!sandbox.destroy().ok(), "unexpected docker errors should surface");
                   }});

  tests.push_back({"diagnostics_bundle_is_never_empty", [] {
                     wt::FakeSandbox sandbox("tenant-acme");
                     sandbox.append_log("Error: cannot find module");
                     const auto bundle = sb::collect_diagnostics(sandbox, "/tmp/agent.log");
                     require(bundle.log_tail.find("cannot find module") != std::string::npos,
                             "log tail should be collected");
                     require(bundle.processes.find("sleep infinity") != std::string::npos,
                             "process list should be collected");
                     require(bundle.ports.find("empty") != std::string::npos,
                             "empty sections should say so");

                     sandbox.fail_exec = true;
                     const auto failed = sb::collect_diagnostics(sandbox, "/tmp/agent.log").to_string();
                     require(failed.find("unavailable") != std::string::npos,
                             "exec failures should be described");
                     require(failed.find("=== processes ===") != std::string::npos,
                             "every section should be present");
                   }});
}
