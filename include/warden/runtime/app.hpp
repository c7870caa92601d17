#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/lifecycle/alarm_scheduler.hpp"
#include "warden/net/http_client.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/storage/blob_store.hpp"
#include "warden/storage/state_store.hpp"
#include "warden/tenant/config_source.hpp"
#include "warden/tenant/registry.hpp"

#include <memory>

namespace warden::runtime {

/// Everything `warden serve` runs on, wired from one Config.
struct Services {
  std::shared_ptr<storage::IStateStore> state;
  std::shared_ptr<storage::IBlobStore> blobs;
  std::shared_ptr<net::HttpClient> http;
  std::shared_ptr<sandbox::ISandboxProvider> sandboxes;
  std::shared_ptr<tenant::IConfigSource> config_source;
  std::shared_ptr<lifecycle::AlarmScheduler> scheduler;
  std::shared_ptr<tenant::ControllerRegistry> registry;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the global observer and opens storage. Alarms persisted by an earlier
  /// run are restored but the scheduler is not started.
  [[nodiscard]] common::Result<Services> create_services();

private:
  config::Config config_;
};

/// Wires a registry whose controllers arm alarms on `scheduler`, and points the
/// scheduler's handler back at the registry.
[[nodiscard]] std::shared_ptr<tenant::ControllerRegistry>
create_registry(const config::Config &config, tenant::ControllerDeps deps,
                const std::shared_ptr<lifecycle::AlarmScheduler> &scheduler);

} // namespace warden::runtime
