#pragma once

#include "warden/common/clock.hpp"
#include "warden/config/schema.hpp"
#include "warden/net/http_client.hpp"
#include "warden/sandbox/docker.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/storage/blob_store.hpp"
#include "warden/storage/state_store.hpp"
#include "warden/tenant/config_source.hpp"
#include "warden/tenant/controller.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::testing {

/// Defaults with observability off and a short health probe budget.
config::Config mock_config();

/// 2026-03-10T12:00:00Z
common::TimePoint fixed_time();

class ManualClock final : public common::Clock {
public:
  explicit ManualClock(common::TimePoint start = fixed_time()) : now_(start) {}

  [[nodiscard]] common::TimePoint now() const override;
  void advance(std::chrono::milliseconds delta);
  void set(common::TimePoint time);

private:
  mutable std::mutex mutex_;
  common::TimePoint now_;
};

/// Sleeper that records requested delays instead of blocking.
class RecordingSleeper {
public:
  RecordingSleeper() : delays_(std::make_shared<std::vector<std::chrono::milliseconds>>()) {}

  [[nodiscard]] common::Sleeper sleeper() const;
  [[nodiscard]] const std::vector<std::chrono::milliseconds> &delays() const { return *delays_; }

private:
  std::shared_ptr<std::vector<std::chrono::milliseconds>> delays_;
};

/// Scriptable in-memory sandbox. Every method bumps calls(), so a warm path can be
/// checked for touching nothing.
class FakeSandbox final : public sandbox::ISandbox {
public:
  explicit FakeSandbox(std::string name) : name_(std::move(name)) {}

  [[nodiscard]] const std::string &name() const override { return name_; }
  [[nodiscard]] common::Status ensure_created() override;
  [[nodiscard]] common::Status mkdir(const std::string &path) override;
  [[nodiscard]] common::Status write_file(const std::string &path,
                                          const std::string &content) override;
  [[nodiscard]] common::Result<int> start_process(const sandbox::ProcessSpec &spec) override;
  [[nodiscard]] net::HttpResponse http_call(const sandbox::SandboxHttpRequest &request,
                                            std::uint16_t port) override;
  [[nodiscard]] net::HttpResponse http_stream(const sandbox::SandboxHttpRequest &request,
                                              std::uint16_t port,
                                              const net::StreamChunkCallback &on_chunk) override;
  [[nodiscard]] common::Result<net::WebSocketTunnel>
  ws_connect(const sandbox::SandboxHttpRequest &request, std::uint16_t port) override;
  [[nodiscard]] common::Result<sandbox::ExecResult> exec(const std::string &command) override;
  [[nodiscard]] common::Status destroy() override;

  [[nodiscard]] std::size_t calls() const { return calls_; }
  /// Requests other than /health probes.
  [[nodiscard]] std::size_t agent_calls() const;
  [[nodiscard]] std::size_t health_probes() const;
  void append_log(const std::string &line) { log_lines.push_back(line); }

  bool created = false;
  bool agent_running = false;
  bool start_makes_healthy = true;
  bool fail_create = false;
  bool fail_mkdir = false;
  bool fail_start = false;
  bool fail_exec = false;
  bool fail_destroy = false;

  std::size_t ensure_created_calls = 0;
  std::size_t destroy_calls = 0;
  std::size_t ws_attempts = 0;
  /// ws_connect fails while this is positive, counting down.
  int ws_failures_remaining = 0;

  std::vector<std::string> mkdirs;
  std::map<std::string, std::string> files;
  std::vector<sandbox::ProcessSpec> started;
  std::vector<sandbox::SandboxHttpRequest> requests;
  std::vector<std::string> exec_commands;
  std::vector<std::string> log_lines;
  /// Written to the agent log by each start_process, honouring '>' versus '>>'.
  std::vector<std::string> start_log_lines;
  /// Appended without a newline after the lines a log read returns.
  std::string unterminated_log_tail;

  /// Replies to non-health calls, consumed in order; the default reply is used after.
  std::deque<net::HttpResponse> scripted_responses;
  std::string default_reply =
      R"({"text":"hello","usage":{"inputTokens":3,"outputTokens":4}})";

  std::vector<std::string> stream_chunks;
  std::uint16_t stream_status = 200;
  bool stream_breaks = false;

private:
  std::string name_;
  std::size_t calls_ = 0;
};

class FakeSandboxProvider final : public sandbox::ISandboxProvider {
public:
  [[nodiscard]] std::shared_ptr<sandbox::ISandbox> get_sandbox(const std::string &name) override;
  /// The sandbox for `name`, created on first use like get_sandbox but not counted.
  [[nodiscard]] std::shared_ptr<FakeSandbox> sandbox(const std::string &name);

  std::size_t get_calls = 0;
  /// Applied to each sandbox when it is first created.
  std::function<void(FakeSandbox &)> on_create;

private:
  std::map<std::string, std::shared_ptr<FakeSandbox>> sandboxes_;
};

class FakeConfigSource final : public tenant::IConfigSource {
public:
  [[nodiscard]] common::Result<tenant::ConfigSnapshot> fetch(const std::string &tenant_id,
                                                             const std::string &user_id) override;

  std::vector<tenant::Skill> skills;
  std::vector<tenant::Connector> connectors;
  bool fail = false;
  std::size_t fetches = 0;
};

class MemoryStateStore final : public storage::IStateStore {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &scope,
                                                               const std::string &key) override;
  [[nodiscard]] common::Status put(const std::string &scope, const std::string &key,
                                   const std::string &value) override;
  [[nodiscard]] common::Result<std::vector<std::pair<std::string, std::string>>>
  list(const std::string &scope, const std::string &prefix) override;
  [[nodiscard]] common::Result<std::vector<std::pair<std::string, std::string>>>
  find_key(const std::string &key) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &scope,
                                            const std::string &key) override;
  [[nodiscard]] common::Result<bool> remove_if_equals(const std::string &scope,
                                                      const std::string &key,
                                                      const std::string &expected) override;

  bool fail_reads = false;
  /// Runs before a conditional remove compares, to interleave a concurrent writer.
  std::function<void()> before_conditional_remove;
  std::map<std::pair<std::string, std::string>, std::string> values;
};

class MemoryBlobStore final : public storage::IBlobStore {
public:
  struct Object {
    std::string content;
    storage::BlobMetadata metadata;
  };

  [[nodiscard]] common::Status put(const std::string &key, const std::string &content,
                                   const storage::BlobMetadata &metadata) override;
  [[nodiscard]] common::Result<std::vector<storage::BlobObject>>
  list(const std::string &prefix) override;
  [[nodiscard]] common::Status remove(const std::string &key) override;

  bool fail_puts = false;
  std::map<std::string, Object> objects;
};

class FakeDockerRunner final : public sandbox::IDockerRunner {
public:
  using Responder =
      std::function<common::Result<sandbox::DockerProcessResult>(const std::vector<std::string> &)>;

  [[nodiscard]] common::Result<sandbox::DockerProcessResult>
  run(const std::vector<std::string> &args,
      const sandbox::DockerCommandOptions &options = {}) override;

  /// Non-zero exits fail unless the call allowed failure, as the real runner does.
  Responder responder;
  std::vector<std::vector<std::string>> calls;
  std::vector<sandbox::DockerCommandOptions> options;
};

class FakeHttpClient final : public net::HttpClient {
public:
  using Responder = std::function<net::HttpResponse(const net::HttpRequest &)>;

  [[nodiscard]] net::HttpResponse send(const net::HttpRequest &request) override;
  [[nodiscard]] net::HttpResponse send_stream(const net::HttpRequest &request,
                                              const net::StreamChunkCallback &on_chunk) override;

  Responder responder;
  std::vector<net::HttpRequest> requests;
};

/// Fakes wired into ControllerDeps, with alarms recorded instead of armed.
struct ControllerHarness {
  explicit ControllerHarness(config::Config base = mock_config());

  [[nodiscard]] tenant::ControllerDeps deps();
  [[nodiscard]] std::shared_ptr<tenant::TenantController> make_controller(const std::string &tenant_id);
  [[nodiscard]] std::string name_for(const std::string &tenant_id) const;
  [[nodiscard]] std::shared_ptr<FakeSandbox> sandbox_for(const std::string &tenant_id);

  config::Config config;
  std::shared_ptr<FakeSandboxProvider> sandboxes;
  std::shared_ptr<FakeConfigSource> config_source;
  std::shared_ptr<MemoryStateStore> state;
  std::shared_ptr<MemoryBlobStore> blobs;
  std::shared_ptr<ManualClock> clock;
  RecordingSleeper sleeper;
  std::shared_ptr<std::vector<std::pair<std::string, std::chrono::milliseconds>>> alarms;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

} // namespace warden::testing
