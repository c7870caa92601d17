#pragma once

#include "warden/common/clock.hpp"
#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/net/websocket.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/storage/blob_store.hpp"
#include "warden/storage/state_store.hpp"
#include "warden/tenant/config_cache.hpp"
#include "warden/tenant/config_source.hpp"
#include "warden/tenant/durable_marker.hpp"
#include "warden/tenant/log_pipeline.hpp"
#include "warden/tenant/proxy.hpp"
#include "warden/tenant/session_store.hpp"
#include "warden/tenant/supervisor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace warden::tenant {

enum class ControllerState { Cold, Provisioning, Configuring, StartingAgent, Ready, Idle };

[[nodiscard]] std::string_view controller_state_name(ControllerState state);

/// Identity resolved by the edge for one inbound request.
struct RequestContext {
  std::string tenant_id;
  std::string user_id;
  std::string roles;
};

/// A JSON reply for the gateway to render.
struct ControllerReply {
  std::uint16_t status = 200;
  std::string body;
};

/// Arms the single wake-up for a controller name; a later call replaces an earlier one.
using ScheduleAlarm = std::function<void(const std::string &name, std::chrono::milliseconds delay)>;

struct ControllerDeps {
  std::shared_ptr<sandbox::ISandboxProvider> sandboxes;
  std::shared_ptr<IConfigSource> config_source;
  std::shared_ptr<storage::IStateStore> state;
  std::shared_ptr<storage::IBlobStore> blobs;
  std::shared_ptr<common::Clock> clock;
  common::Sleeper sleeper;
  ScheduleAlarm schedule_alarm;
};

struct AlarmOutcome {
  /// The sandbox was destroyed; the instance may be dropped from memory.
  bool evict = false;
  std::optional<std::chrono::milliseconds> rescheduled;
};

/// Owns one tenant's sandbox lifecycle. Requests are serialized by an internal mutex;
/// nothing held in memory is assumed to survive eviction except what DurableMarker
/// and SessionStore persist.
class TenantController {
public:
  TenantController(std::string name, const config::Config &config, ControllerDeps deps);

  TenantController(const TenantController &) = delete;
  TenantController &operator=(const TenantController &) = delete;

  /// Brings config, sandbox and agent up to date. Warm calls touch nothing.
  [[nodiscard]] common::Status ensure_ready(const std::string &tenant_id,
                                            const std::string &user_id);

  [[nodiscard]] ControllerReply handle_chat(const RequestContext &context,
                                            const std::string &body);
  /// Relays the agent stream into `sink`. Errors before the stream begins are returned
  /// for the caller to render as a JSON reply.
  [[nodiscard]] common::Result<StreamOutcome> handle_stream(const RequestContext &context,
                                                            const std::string &body,
                                                            const StreamSink &sink);
  /// Opens a tunnel to the agent's /ws/chat. The caller relays bytes outside the lock.
  [[nodiscard]] common::Result<net::WebSocketTunnel>
  handle_websocket(const RequestContext &context, const std::string &path);

  [[nodiscard]] ControllerReply list_sessions(const RequestContext &context);
  [[nodiscard]] ControllerReply get_session(const RequestContext &context,
                                            const std::string &session_id);

  /// Timer entry point: flushes logs and destroys the sandbox once idle.
  [[nodiscard]] AlarmOutcome on_alarm();

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] ControllerState state() const;
  [[nodiscard]] bool believed_running() const;
  [[nodiscard]] std::string injected_hash() const;
  [[nodiscard]] std::size_t log_offset() const;
  [[nodiscard]] std::size_t buffered_logs() const;
  [[nodiscard]] std::uint64_t config_fetches() const;

private:
  [[nodiscard]] common::Status ensure_ready_locked(const std::string &tenant_id,
                                                   const std::string &user_id);
  [[nodiscard]] ConfigSnapshot resolve_snapshot(const std::string &tenant_id,
                                                const std::string &user_id);
  [[nodiscard]] common::Status inject_config(const ConfigSnapshot &snapshot);
  void enter_state(ControllerState state);
  void note_activity(const std::string &tenant_id);
  void reschedule_locked();
  [[nodiscard]] std::chrono::milliseconds next_alarm_delay_locked();
  void reset_volatile_state();
  [[nodiscard]] std::string recover_tenant_id();
  [[nodiscard]] std::string agent_log_tail();

  std::string name_;
  config::AgentConfig agent_;
  config::LifecycleConfig lifecycle_;
  config::SandboxConfig sandbox_config_;
  ControllerDeps deps_;

  mutable std::mutex mutex_;
  ControllerState state_ = ControllerState::Cold;
  std::shared_ptr<sandbox::ISandbox> sandbox_;
  std::string injected_hash_;
  std::uint64_t config_fetches_ = 0;

  ConfigCache cache_;
  ProcessSupervisor supervisor_;
  RequestProxy proxy_;
  LogPipeline logs_;
  DurableMarker marker_;
  SessionStore sessions_;
};

/// 500 {"error":"Chat processing failed","message",...}; diagnostics are attached only
/// for cold-start and proxy failures.
[[nodiscard]] ControllerReply failure_reply(const common::Error &error,
                                            const std::string &session_id = "");

/// Random RFC 4122 version 4 identifier.
[[nodiscard]] std::string generate_session_id();

} // namespace warden::tenant
