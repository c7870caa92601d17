#include "warden/tenant/controller.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"
#include "warden/health/health.hpp"
#include "warden/observability/global.hpp"
#include "warden/sandbox/diagnostics.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <random>

namespace warden::tenant {

namespace {

constexpr const char *kDefaultUsage = R"({"inputTokens":0,"outputTokens":0})";
constexpr std::chrono::milliseconds kMinimumAlarmDelay{1'000};

struct ChatInput {
  std::string message;
  std::string session_id;
};

ChatInput parse_chat_input(const std::string &body) {
  const auto members = common::json_object_members(body);
  return ChatInput{
      .message = common::json_value_as_string(common::json_member(members, "message")),
      .session_id = common::json_value_as_string(common::json_member(members, "sessionId")),
  };
}

std::string render_agent_payload(const ChatInput &input) {
  return "{\"message\":" + common::json_string(input.message) +
         ",\"sessionId\":" + common::json_string(input.session_id) + "}";
}

bool is_present(const std::string &raw) {
  return !raw.empty() && raw != "null" && raw != "\"\"" && raw != "false";
}

bool carries_diagnostics(const common::ErrorKind kind) {
  return kind == common::ErrorKind::ColdStart || kind == common::ErrorKind::Proxy;
}

std::uint64_t usage_tokens(const std::string &usage) {
  std::uint64_t total = 0;
  for (const char *field : {"inputTokens", "outputTokens"}) {
    const std::string number = common::json_get_number(usage, field);
    if (!number.empty()) {
      total += std::strtoull(number.c_str(), nullptr, 10);
    }
  }
  return total;
}

} // namespace

ControllerReply failure_reply(const common::Error &error, const std::string &session_id) {
  std::string body = "{\"error\":\"Chat processing failed\",\"message\":" +
                     common::json_string(error.message);
  if (!session_id.empty()) {
    body += ",\"sessionId\":" + common::json_string(session_id);
  }
  if (carries_diagnostics(error.kind) && !error.diagnostics.empty()) {
    body += ",\"diagnostics\":" + common::json_string(error.diagnostics);
  }
  body += "}";
  return ControllerReply{.status = 500, .body = std::move(body)};
}

std::string_view controller_state_name(const ControllerState state) {
  switch (state) {
  case ControllerState::Cold:
    return "cold";
  case ControllerState::Provisioning:
    return "provisioning";
  case ControllerState::Configuring:
    return "configuring";
  case ControllerState::StartingAgent:
    return "starting_agent";
  case ControllerState::Ready:
    return "ready";
  case ControllerState::Idle:
    return "idle";
  }
  return "cold";
}

std::string generate_session_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    std::random_device device;
    for (auto &byte : bytes) {
      byte = static_cast<unsigned char>(device() & 0xFF);
    }
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::string out;
  out.reserve(36);
  char hex[3];
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    std::snprintf(hex, sizeof(hex), "%02x", bytes[i]);
    out += hex;
  }
  return out;
}

TenantController::TenantController(std::string name, const config::Config &config,
                                   ControllerDeps deps)
    : name_(std::move(name)), agent_(config.agent), lifecycle_(config.lifecycle),
      sandbox_config_(config.sandbox), deps_(std::move(deps)),
      cache_(config.lifecycle.config_ttl, deps_.clock),
      supervisor_(config.agent, config.credentials, deps_.sleeper),
      proxy_(config.agent, config.lifecycle.websocket_backoff, deps_.sleeper),
      logs_(config.logs, config.agent.log_path, deps_.blobs, deps_.clock),
      marker_(deps_.state, name_), sessions_(deps_.state, name_) {}

ControllerState TenantController::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool TenantController::believed_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return supervisor_.believed_running();
}

std::string TenantController::injected_hash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return injected_hash_;
}

std::size_t TenantController::log_offset() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_.offset();
}

std::size_t TenantController::buffered_logs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_.buffered();
}

std::uint64_t TenantController::config_fetches() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_fetches_;
}

void TenantController::enter_state(const ControllerState state) {
  if (state_ == state) {
    return;
  }
  state_ = state;
  observability::record_lifecycle(name_, std::string(controller_state_name(state)));
}

common::Status TenantController::ensure_ready(const std::string &tenant_id,
                                              const std::string &user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_ready_locked(tenant_id, user_id);
}

ConfigSnapshot TenantController::resolve_snapshot(const std::string &tenant_id,
                                                  const std::string &user_id) {
  if (auto cached = cache_.get(tenant_id, user_id); cached.has_value()) {
    return std::move(*cached);
  }
  ++config_fetches_;
  auto fetched = deps_.config_source->fetch(tenant_id, user_id);
  if (!fetched.ok()) {
    // Not cached, so the next request asks the config service again.
    observability::record_error("config", "using empty configuration for " + tenant_id + ": " +
                                              fetched.error());
    return empty_snapshot(tenant_id, user_id);
  }
  cache_.put(fetched.value());
  return std::move(fetched.value());
}

common::Status TenantController::ensure_ready_locked(const std::string &tenant_id,
                                                     const std::string &user_id) {
  const std::string component = health::sandbox_component(name_);
  const auto fetches_before = config_fetches_;
  const ConfigSnapshot snapshot = resolve_snapshot(tenant_id, user_id);
  const std::string hash = compute_config_hash(snapshot);

  if (state_ != ControllerState::Ready || !sandbox_) {
    health::mark_component_starting(component);
    enter_state(ControllerState::Provisioning);
    if (!sandbox_) {
      sandbox_ = deps_.sandboxes->get_sandbox(name_);
    }
    auto created = sandbox_ ? sandbox_->ensure_created()
                            : common::Status::error("no sandbox handle for " + name_);
    if (!created.ok()) {
      sandbox_.reset();
      supervisor_.clear_running();
      enter_state(ControllerState::Cold);
      health::mark_component_error(component, created.error());
      observability::record_sandbox(name_, "provision", false, created.error());
      return common::Status::error("sandbox provisioning failed: " + created.error(),
                                   common::ErrorKind::SandboxProvision);
    }
    observability::record_sandbox(name_, "provision", true);
  }

  if (hash != injected_hash_) {
    enter_state(ControllerState::Configuring);
    if (auto injected = inject_config(snapshot); !injected.ok()) {
      injected_hash_.clear();
      enter_state(ControllerState::Cold);
      health::mark_component_error(component, injected.error());
      return common::Status::error("configuration injection failed: " + injected.error(),
                                   common::ErrorKind::SandboxProvision);
    }
    injected_hash_ = hash;
    observability::record_config_inject(tenant_id, hash, snapshot.skills.size(), false);
  } else if (config_fetches_ != fetches_before) {
    observability::record_config_inject(tenant_id, hash, snapshot.skills.size(), true);
  }

  if (!supervisor_.believed_running()) {
    enter_state(ControllerState::StartingAgent);
  }
  if (auto running = supervisor_.ensure_agent_running(*sandbox_, snapshot); !running.ok()) {
    enter_state(ControllerState::Cold);
    return running;
  }

  if (state_ != ControllerState::Ready) {
    enter_state(ControllerState::Ready);
    health::mark_component_ok(component);
  }
  return common::Status::success();
}

common::Status TenantController::inject_config(const ConfigSnapshot &snapshot) {
  sandbox::ISandbox &target = *sandbox_;
  if (auto status = target.mkdir(agent_.skills_path); !status.ok()) {
    return status;
  }
  for (const auto &skill : snapshot.skills) {
    if (!is_safe_skill_name(skill.name)) {
      observability::record_error("config", "skipping skill with unsafe name '" + skill.name +
                                                "' for " + snapshot.tenant_id);
      continue;
    }
    if (!skill.content.has_value()) {
      continue;
    }
    const std::string dir = agent_.skills_path + "/" + skill.name;
    if (auto status = target.mkdir(dir); !status.ok()) {
      return status;
    }
    if (auto status = target.write_file(dir + "/SKILL.md", *skill.content); !status.ok()) {
      return status;
    }
  }

  if (auto status = target.mkdir(agent_.config_dir); !status.ok()) {
    return status;
  }
  return target.write_file(agent_.config_dir + "/connectors.json",
                           render_connectors_json(snapshot.connectors));
}

void TenantController::note_activity(const std::string &tenant_id) {
  if (auto status = marker_.touch(tenant_id, deps_.clock->now()); !status.ok()) {
    observability::record_error("controller", "failed to record activity for " + name_ + ": " +
                                                  status.error());
  }
}

std::chrono::milliseconds TenantController::next_alarm_delay_locked() {
  if (supervisor_.believed_running()) {
    return lifecycle_.flush_interval;
  }
  auto last = marker_.last_activity();
  if (!last.ok() || !last.value().has_value()) {
    return lifecycle_.idle_threshold;
  }
  const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(deps_.clock->now() -
                                                                           *last.value());
  const auto remaining = lifecycle_.idle_threshold - idle;
  return std::min(std::max(remaining, kMinimumAlarmDelay), lifecycle_.idle_threshold);
}

void TenantController::reschedule_locked() {
  if (deps_.schedule_alarm) {
    deps_.schedule_alarm(name_, next_alarm_delay_locked());
  }
}

std::string TenantController::agent_log_tail() {
  if (!sandbox_) {
    return "empty";
  }
  return sandbox::collect_log_tail(*sandbox_, agent_.log_path, 50);
}

ControllerReply TenantController::handle_chat(const RequestContext &context,
                                              const std::string &body) {
  ChatInput input = parse_chat_input(body);
  if (common::trim(input.message).empty()) {
    return ControllerReply{.status = 400, .body = R"({"error":"Message is required"})"};
  }
  if (input.session_id.empty()) {
    input.session_id = generate_session_id();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  note_activity(context.tenant_id);

  const auto reply = [&]() -> ControllerReply {
    if (auto ready = ensure_ready_locked(context.tenant_id, context.user_id); !ready.ok()) {
      return failure_reply(ready.details(), input.session_id);
    }

    const ProxyRequest request{.path = "/chat",
                               .tenant_id = context.tenant_id,
                               .user_id = context.user_id,
                               .roles = context.roles,
                               .body = render_agent_payload(input)};
    const auto restart = [&]() { return ensure_ready_locked(context.tenant_id, context.user_id); };
    auto proxied = proxy_.proxy_chat(*sandbox_, supervisor_, restart, request);
    if (!proxied.ok()) {
      return failure_reply(proxied.details(), input.session_id);
    }

    const auto &response = proxied.value();
    if (response.status < 200 || response.status >= 300) {
      return ControllerReply{.status = 500,
                             .body = "{\"error\":\"Agent execution failed\",\"details\":" +
                                     common::json_string(response.body) +
                                     ",\"sessionId\":" + common::json_string(input.session_id) +
                                     "}"};
    }

    const std::string agent_body = common::trim(response.body);
    if (agent_body.empty() || agent_body.front() != '{') {
      return failure_reply(common::Error{.kind = common::ErrorKind::Proxy,
                                         .message = "agent returned a non-JSON reply"},
                           input.session_id);
    }
    const auto members = common::json_object_members(agent_body);
    std::string usage = common::json_member(members, "usage");
    if (!is_present(usage)) {
      usage = kDefaultUsage;
    }

    if (is_present(common::json_member(members, "error"))) {
      return ControllerReply{
          .status = 200,
          .body = "{\"response\":" + agent_body + ",\"sessionId\":" +
                  common::json_string(input.session_id) + ",\"usage\":" + usage +
                  ",\"diagnostics\":{\"agentLog\":" + common::json_string(agent_log_tail()) + "}}"};
    }

    if (const auto tokens = usage_tokens(usage); tokens > 0) {
      observability::record_metric(observability::TokensUsedMetric{.tokens = tokens});
    }

    const SessionRecord record{.id = input.session_id,
                               .last_message = input.message,
                               .last_response = agent_body,
                               .updated_at = deps_.clock->now()};
    if (auto saved = sessions_.save(context.user_id, record); !saved.ok()) {
      observability::record_error("controller", "failed to store session " + input.session_id +
                                                    ": " + saved.error());
    }

    std::string text = common::json_member(members, "text");
    if (!is_present(text)) {
      text = common::json_member(members, "response");
    }
    if (!is_present(text)) {
      text = agent_body;
    }
    return ControllerReply{.status = 200,
                           .body = "{\"response\":" + text + ",\"sessionId\":" +
                                   common::json_string(input.session_id) + ",\"usage\":" + usage +
                                   "}"};
  }();

  reschedule_locked();
  return reply;
}

common::Result<StreamOutcome> TenantController::handle_stream(const RequestContext &context,
                                                              const std::string &body,
                                                              const StreamSink &sink) {
  ChatInput input = parse_chat_input(body);
  if (common::trim(input.message).empty()) {
    return common::Result<StreamOutcome>::failure("Message is required",
                                                  common::ErrorKind::Invalid);
  }
  if (input.session_id.empty()) {
    input.session_id = generate_session_id();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  note_activity(context.tenant_id);

  auto outcome = [&]() -> common::Result<StreamOutcome> {
    if (auto ready = ensure_ready_locked(context.tenant_id, context.user_id); !ready.ok()) {
      return common::Result<StreamOutcome>::failure(ready.details());
    }
    const ProxyRequest request{.path = "/chat/stream",
                               .tenant_id = context.tenant_id,
                               .user_id = context.user_id,
                               .roles = context.roles,
                               .body = render_agent_payload(input)};
    return proxy_.proxy_stream(*sandbox_, supervisor_, request, sink);
  }();

  reschedule_locked();
  return outcome;
}

common::Result<net::WebSocketTunnel>
TenantController::handle_websocket(const RequestContext &context, const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  note_activity(context.tenant_id);

  const auto attempt = [&](const int index) -> common::Result<net::WebSocketTunnel> {
    if (index > 0) {
      supervisor_.clear_running();
      enter_state(ControllerState::Cold);
    }
    if (auto ready = ensure_ready_locked(context.tenant_id, context.user_id); !ready.ok()) {
      return common::Result<net::WebSocketTunnel>::failure(ready.details());
    }
    sandbox::SandboxHttpRequest request;
    request.method = "GET";
    request.path = path;
    request.headers = {{"X-Tenant-Id", context.tenant_id}, {"X-User-Id", context.user_id}};
    if (!context.roles.empty()) {
      request.headers["X-User-Roles"] = context.roles;
    }
    request.timeout = agent_.request_timeout;
    auto tunnel = sandbox_->ws_connect(request, agent_.port);
    if (!tunnel.ok()) {
      supervisor_.clear_running();
    }
    return tunnel;
  };

  auto tunnel = proxy_.proxy_websocket(context.tenant_id, attempt);
  reschedule_locked();
  return tunnel;
}

ControllerReply TenantController::list_sessions(const RequestContext &context) {
  std::lock_guard<std::mutex> lock(mutex_);
  note_activity(context.tenant_id);
  reschedule_locked();

  auto sessions = sessions_.list(context.user_id);
  if (!sessions.ok()) {
    return ControllerReply{.status = 500,
                           .body = "{\"error\":\"Failed to list sessions\",\"message\":" +
                                   common::json_string(sessions.error()) + "}"};
  }
  std::string body = "{\"sessions\":[";
  bool first = true;
  for (const auto &record : sessions.value()) {
    if (!first) {
      body += ",";
    }
    first = false;
    body += render_session(record);
  }
  body += "]}";
  return ControllerReply{.status = 200, .body = std::move(body)};
}

ControllerReply TenantController::get_session(const RequestContext &context,
                                              const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  note_activity(context.tenant_id);
  reschedule_locked();

  auto session = sessions_.get(context.user_id, session_id);
  if (!session.ok()) {
    return ControllerReply{.status = 500,
                           .body = "{\"error\":\"Failed to read session\",\"message\":" +
                                   common::json_string(session.error()) + "}"};
  }
  if (!session.value().has_value()) {
    return ControllerReply{.status = 404, .body = R"({"error":"Session not found"})"};
  }
  return ControllerReply{.status = 200, .body = render_session(*session.value())};
}

std::string TenantController::recover_tenant_id() {
  auto stored = marker_.tenant_id();
  if (stored.ok() && stored.value().has_value() && !stored.value()->empty()) {
    return *stored.value();
  }
  if (auto parsed = sandbox::tenant_from_sandbox_name(sandbox_config_.name_prefix, name_);
      parsed.has_value()) {
    return *parsed;
  }
  return name_;
}

void TenantController::reset_volatile_state() {
  sandbox_.reset();
  supervisor_.clear_running();
  injected_hash_.clear();
  logs_.reset();
}

AlarmOutcome TenantController::on_alarm() {
  std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    // A request is in flight, so the tenant is active.
    if (deps_.schedule_alarm) {
      deps_.schedule_alarm(name_, lifecycle_.flush_interval);
    }
    return AlarmOutcome{.evict = false, .rescheduled = lifecycle_.flush_interval};
  }

  const std::string tenant_id = recover_tenant_id();
  if (!sandbox_) {
    sandbox_ = deps_.sandboxes->get_sandbox(name_);
  }

  const auto pull_and_flush = [&]() {
    if (!sandbox_) {
      return;
    }
    if (auto pulled = logs_.pull_and_buffer(*sandbox_, tenant_id); !pulled.ok()) {
      observability::record_error("logs", "pull for " + tenant_id + " failed: " + pulled.error());
    }
    observability::record_metric(
        observability::LogBufferDepthMetric{.depth = static_cast<std::uint64_t>(logs_.buffered())});
    if (auto flushed = logs_.flush(tenant_id); !flushed.ok()) {
      observability::record_error("logs", flushed.error());
    }
  };
  pull_and_flush();

  auto last = marker_.last_activity();
  if (!last.ok()) {
    observability::record_error("controller", "cannot read activity for " + name_ + ": " +
                                                  last.error());
    const auto delay = lifecycle_.flush_interval;
    if (deps_.schedule_alarm) {
      deps_.schedule_alarm(name_, delay);
    }
    return AlarmOutcome{.evict = false, .rescheduled = delay};
  }

  const auto now = deps_.clock->now();
  const bool idle =
      !last.value().has_value() ||
      std::chrono::duration_cast<std::chrono::milliseconds>(now - *last.value()) >
          lifecycle_.idle_threshold;

  if (!idle) {
    const auto delay = next_alarm_delay_locked();
    if (deps_.schedule_alarm) {
      deps_.schedule_alarm(name_, delay);
    }
    return AlarmOutcome{.evict = false, .rescheduled = delay};
  }

  pull_and_flush();
  if (sandbox_) {
    if (auto destroyed = sandbox_->destroy(); !destroyed.ok()) {
      observability::record_sandbox(name_, "destroy", false, destroyed.error());
      const auto delay = lifecycle_.flush_interval;
      if (deps_.schedule_alarm) {
        deps_.schedule_alarm(name_, delay);
      }
      return AlarmOutcome{.evict = false, .rescheduled = delay};
    }
    observability::record_sandbox(name_, "destroy", true, "idle");
  }

  reset_volatile_state();
  if (auto removed = logs_.cleanup_old(tenant_id); !removed.ok()) {
    observability::record_error("logs", "retention cleanup for " + tenant_id + " failed: " +
                                            removed.error());
  } else if (removed.value() > 0) {
    observability::record_notice("logs", "removed " + std::to_string(removed.value()) +
                                             " expired log batches for " + tenant_id);
  }
  enter_state(ControllerState::Idle);
  health::reset_component(health::sandbox_component(name_));
  return AlarmOutcome{.evict = true, .rescheduled = std::nullopt};
}

} // namespace warden::tenant
