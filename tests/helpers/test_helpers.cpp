#include "tests/helpers/test_helpers.hpp"

#include "warden/common/fs.hpp"
#include "warden/sandbox/sandbox.hpp"

#include <charconv>
#include <fstream>
#include <random>

namespace warden::testing {

namespace {

std::size_t parse_number_after(const std::string &text, const std::string &marker,
                               const std::size_t fallback) {
  const auto pos = text.find(marker);
  if (pos == std::string::npos) {
    return fallback;
  }
  const char *begin = text.data() + pos + marker.size();
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(begin, text.data() + text.size(), value);
  if (ec != std::errc() || ptr == begin) {
    return fallback;
  }
  return value;
}

net::HttpResponse refused() {
  net::HttpResponse response;
  response.network_error = true;
  response.network_error_message = "connection refused";
  return response;
}

} // namespace

config::Config mock_config() {
  config::Config config;
  config.observability.backend = "none";
  config.sandbox.name_prefix = "tenant-";
  config.agent.health_attempts = 3;
  config.agent.health_interval = std::chrono::milliseconds(50);
  config.control_plane.url = "http://control-plane.test";
  config.control_plane.internal_key = "internal-key";
  config.credentials.anthropic_api_key = "sk-test";
  return config;
}

common::TimePoint fixed_time() { return common::from_unix_ms(1'773'144'000'000); }

common::TimePoint ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::advance(const std::chrono::milliseconds delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

void ManualClock::set(const common::TimePoint time) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = time;
}

common::Sleeper RecordingSleeper::sleeper() const {
  auto delays = delays_;
  return [delays](const std::chrono::milliseconds delay) { delays->push_back(delay); };
}

common::Status FakeSandbox::ensure_created() {
  ++calls_;
  ++ensure_created_calls;
  if (fail_create) {
    return common::Status::error("docker daemon unavailable", common::ErrorKind::SandboxProvision);
  }
  created = true;
  return common::Status::success();
}

common::Status FakeSandbox::mkdir(const std::string &path) {
  ++calls_;
  if (fail_mkdir) {
    return common::Status::error("mkdir " + path + ": read-only file system");
  }
  mkdirs.push_back(path);
  return common::Status::success();
}

common::Status FakeSandbox::write_file(const std::string &path, const std::string &content) {
  ++calls_;
  files[path] = content;
  return common::Status::success();
}

common::Result<int> FakeSandbox::start_process(const sandbox::ProcessSpec &spec) {
  ++calls_;
  started.push_back(spec);
  if (fail_start) {
    return common::Result<int>::failure("exec failed", common::ErrorKind::ColdStart);
  }
  if (spec.command.find(" >> ") == std::string::npos && spec.command.find(" > ") != std::string::npos) {
    log_lines.clear();
  }
  log_lines.insert(log_lines.end(), start_log_lines.begin(), start_log_lines.end());
  agent_running = start_makes_healthy;
  return common::Result<int>::success(42);
}

net::HttpResponse FakeSandbox::http_call(const sandbox::SandboxHttpRequest &request,
                                         const std::uint16_t) {
  ++calls_;
  requests.push_back(request);
  if (request.path == "/health") {
    if (!agent_running) {
      return refused();
    }
    net::HttpResponse response;
    response.status = 200;
    response.body = R"({"status":"ok"})";
    return response;
  }
  if (!scripted_responses.empty()) {
    auto response = scripted_responses.front();
    scripted_responses.pop_front();
    return response;
  }
  net::HttpResponse response;
  response.status = 200;
  response.body = default_reply;
  return response;
}

net::HttpResponse FakeSandbox::http_stream(const sandbox::SandboxHttpRequest &request,
                                           const std::uint16_t,
                                           const net::StreamChunkCallback &on_chunk) {
  ++calls_;
  requests.push_back(request);
  net::HttpResponse response;
  for (const auto &chunk : stream_chunks) {
    if (!on_chunk(stream_status, chunk)) {
      response.cancelled = true;
      response.status = stream_status;
      return response;
    }
  }
  if (stream_breaks) {
    response.network_error = true;
    response.network_error_message = "connection reset by peer";
    return response;
  }
  response.status = stream_status;
  return response;
}

common::Result<net::WebSocketTunnel> FakeSandbox::ws_connect(const sandbox::SandboxHttpRequest &request,
                                                             const std::uint16_t) {
  ++calls_;
  ++ws_attempts;
  requests.push_back(request);
  if (ws_failures_remaining > 0) {
    --ws_failures_remaining;
    return common::Result<net::WebSocketTunnel>::failure("connection refused",
                                                         common::ErrorKind::Proxy);
  }
  net::WebSocketTunnel tunnel;
  tunnel.pending = "ready";
  return common::Result<net::WebSocketTunnel>::success(std::move(tunnel));
}

common::Result<sandbox::ExecResult> FakeSandbox::exec(const std::string &command) {
  ++calls_;
  exec_commands.push_back(command);
  if (fail_exec) {
    return common::Result<sandbox::ExecResult>::failure("exec: container is not running");
  }

  sandbox::ExecResult result;
  if (common::starts_with(command, "tail -n +")) {
    const std::size_t from = parse_number_after(command, "tail -n +", 1);
    const std::size_t limit = parse_number_after(command, "head -n ", log_lines.size());
    for (std::size_t i = from == 0 ? 0 : from - 1, taken = 0;
         i < log_lines.size() && taken < limit; ++i, ++taken) {
      result.stdout_text += log_lines[i] + "\n";
    }
    result.stdout_text += unterminated_log_tail;
  } else if (common::starts_with(command, "tail -n ")) {
    for (const auto &line : log_lines) {
      result.stdout_text += line + "\n";
    }
  } else if (common::starts_with(command, "ps ")) {
    result.stdout_text = "PID COMMAND\n1 sleep infinity\n";
  }
  return common::Result<sandbox::ExecResult>::success(std::move(result));
}

common::Status FakeSandbox::destroy() {
  ++calls_;
  ++destroy_calls;
  if (fail_destroy) {
    return common::Status::error("container removal in progress");
  }
  created = false;
  agent_running = false;
  files.clear();
  log_lines.clear();
  return common::Status::success();
}

std::size_t FakeSandbox::agent_calls() const {
  std::size_t count = 0;
  for (const auto &request : requests) {
    count += request.path == "/health" ? 0 : 1;
  }
  return count;
}

std::size_t FakeSandbox::health_probes() const { return requests.size() - agent_calls(); }

std::shared_ptr<sandbox::ISandbox> FakeSandboxProvider::get_sandbox(const std::string &name) {
  ++get_calls;
  return sandbox(name);
}

std::shared_ptr<FakeSandbox> FakeSandboxProvider::sandbox(const std::string &name) {
  auto it = sandboxes_.find(name);
  if (it != sandboxes_.end()) {
    return it->second;
  }
  auto created = std::make_shared<FakeSandbox>(name);
  if (on_create) {
    on_create(*created);
  }
  sandboxes_.emplace(name, created);
  return created;
}

common::Result<tenant::ConfigSnapshot> FakeConfigSource::fetch(const std::string &tenant_id,
                                                               const std::string &user_id) {
  ++fetches;
  if (fail) {
    return common::Result<tenant::ConfigSnapshot>::failure("control plane returned HTTP 503",
                                                           common::ErrorKind::ConfigFetch);
  }
  return common::Result<tenant::ConfigSnapshot>::success(tenant::ConfigSnapshot{
      .tenant_id = tenant_id, .user_id = user_id, .skills = skills, .connectors = connectors});
}

common::Result<std::optional<std::string>> MemoryStateStore::get(const std::string &scope,
                                                                 const std::string &key) {
  if (fail_reads) {
    return common::Result<std::optional<std::string>>::failure("database is locked");
  }
  const auto it = values.find({scope, key});
  if (it == values.end()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  return common::Result<std::optional<std::string>>::success(it->second);
}

common::Status MemoryStateStore::put(const std::string &scope, const std::string &key,
                                     const std::string &value) {
  values[{scope, key}] = value;
  return common::Status::success();
}

common::Result<std::vector<std::pair<std::string, std::string>>>
MemoryStateStore::list(const std::string &scope, const std::string &prefix) {
  using Rows = std::vector<std::pair<std::string, std::string>>;
  if (fail_reads) {
    return common::Result<Rows>::failure("database is locked");
  }
  Rows rows;
  for (const auto &[id, value] : values) {
    if (id.first == scope && common::starts_with(id.second, prefix)) {
      rows.emplace_back(id.second, value);
    }
  }
  return common::Result<Rows>::success(std::move(rows));
}

common::Result<std::vector<std::pair<std::string, std::string>>>
MemoryStateStore::find_key(const std::string &key) {
  using Rows = std::vector<std::pair<std::string, std::string>>;
  Rows rows;
  for (const auto &[id, value] : values) {
    if (id.second == key) {
      rows.emplace_back(id.first, value);
    }
  }
  return common::Result<Rows>::success(std::move(rows));
}

common::Result<bool> MemoryStateStore::remove(const std::string &scope, const std::string &key) {
  return common::Result<bool>::success(values.erase({scope, key}) > 0);
}

common::Result<bool> MemoryStateStore::remove_if_equals(const std::string &scope,
                                                        const std::string &key,
                                                        const std::string &expected) {
  if (before_conditional_remove) {
    const auto hook = std::move(before_conditional_remove);
    before_conditional_remove = nullptr;
    hook();
  }
  const auto it = values.find({scope, key});
  if (it == values.end() || it->second != expected) {
    return common::Result<bool>::success(false);
  }
  values.erase(it);
  return common::Result<bool>::success(true);
}

common::Status MemoryBlobStore::put(const std::string &key, const std::string &content,
                                    const storage::BlobMetadata &metadata) {
  if (fail_puts) {
    return common::Status::error("bucket unavailable");
  }
  objects[key] = Object{.content = content, .metadata = metadata};
  return common::Status::success();
}

common::Result<std::vector<storage::BlobObject>> MemoryBlobStore::list(const std::string &prefix) {
  std::vector<storage::BlobObject> out;
  for (const auto &[key, object] : objects) {
    if (common::starts_with(key, prefix)) {
      out.push_back(storage::BlobObject{.key = key, .size = object.content.size()});
    }
  }
  return common::Result<std::vector<storage::BlobObject>>::success(std::move(out));
}

common::Status MemoryBlobStore::remove(const std::string &key) {
  objects.erase(key);
  return common::Status::success();
}

common::Result<sandbox::DockerProcessResult>
FakeDockerRunner::run(const std::vector<std::string> &args,
                      const sandbox::DockerCommandOptions &call_options) {
  calls.push_back(args);
  options.push_back(call_options);
  if (!responder) {
    return common::Result<sandbox::DockerProcessResult>::success({});
  }
  auto result = responder(args);
  if (result.ok() && result.value().exit_code != 0 && !call_options.allow_failure) {
    return common::Result<sandbox::DockerProcessResult>::failure(
        result.value().stderr_text.empty() ? "docker command failed" : result.value().stderr_text);
  }
  return result;
}

net::HttpResponse FakeHttpClient::send(const net::HttpRequest &request) {
  requests.push_back(request);
  if (responder) {
    return responder(request);
  }
  net::HttpResponse response;
  response.status = 200;
  response.body = "{}";
  return response;
}

net::HttpResponse FakeHttpClient::send_stream(const net::HttpRequest &request,
                                              const net::StreamChunkCallback &on_chunk) {
  auto response = send(request);
  if (!response.failed() && !on_chunk(response.status, response.body)) {
    response.cancelled = true;
  }
  response.body.clear();
  return response;
}

ControllerHarness::ControllerHarness(config::Config base)
    : config(std::move(base)), sandboxes(std::make_shared<FakeSandboxProvider>()),
      config_source(std::make_shared<FakeConfigSource>()),
      state(std::make_shared<MemoryStateStore>()), blobs(std::make_shared<MemoryBlobStore>()),
      clock(std::make_shared<ManualClock>()),
      alarms(std::make_shared<std::vector<std::pair<std::string, std::chrono::milliseconds>>>()) {}

tenant::ControllerDeps ControllerHarness::deps() {
  auto recorded = alarms;
  return tenant::ControllerDeps{
      .sandboxes = sandboxes,
      .config_source = config_source,
      .state = state,
      .blobs = blobs,
      .clock = clock,
      .sleeper = sleeper.sleeper(),
      .schedule_alarm =
          [recorded](const std::string &name, const std::chrono::milliseconds delay) {
            recorded->emplace_back(name, delay);
          },
  };
}

std::string ControllerHarness::name_for(const std::string &tenant_id) const {
  return sandbox::sandbox_name_for_tenant(config.sandbox.name_prefix, tenant_id);
}

std::shared_ptr<tenant::TenantController>
ControllerHarness::make_controller(const std::string &tenant_id) {
  return std::make_shared<tenant::TenantController>(name_for(tenant_id), config, deps());
}

std::shared_ptr<FakeSandbox> ControllerHarness::sandbox_for(const std::string &tenant_id) {
  return sandboxes->sandbox(name_for(tenant_id));
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("warden-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

} // namespace warden::testing
