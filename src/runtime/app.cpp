#include "warden/runtime/app.hpp"

#include "warden/common/clock.hpp"
#include "warden/common/fs.hpp"
#include "warden/config/config.hpp"
#include "warden/observability/factory.hpp"
#include "warden/observability/global.hpp"
#include "warden/sandbox/docker.hpp"
#include "warden/sandbox/docker_sandbox.hpp"

#include <filesystem>

namespace warden::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.details());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

std::shared_ptr<tenant::ControllerRegistry>
create_registry(const config::Config &config, tenant::ControllerDeps deps,
                const std::shared_ptr<lifecycle::AlarmScheduler> &scheduler) {
  std::weak_ptr<lifecycle::AlarmScheduler> weak_scheduler = scheduler;
  deps.schedule_alarm = [weak_scheduler](const std::string &name,
                                         const std::chrono::milliseconds delay) {
    auto locked = weak_scheduler.lock();
    if (locked == nullptr) {
      return;
    }
    if (auto scheduled = locked->schedule(name, delay); !scheduled.ok()) {
      observability::record_error("scheduler", "failed to arm alarm for " + name + ": " +
                                                   scheduled.error());
    }
  };

  auto registry = std::make_shared<tenant::ControllerRegistry>(
      config.sandbox.name_prefix, [config, deps](const std::string &name) {
        return std::make_shared<tenant::TenantController>(name, config, deps);
      });

  std::weak_ptr<tenant::ControllerRegistry> weak_registry = registry;
  scheduler->set_handler([weak_registry](const std::string &name) {
    if (auto locked = weak_registry.lock(); locked != nullptr) {
      (void)locked->dispatch_alarm(name);
    }
  });
  return registry;
}

common::Result<Services> RuntimeContext::create_services() {
  observability::set_global_observer(observability::create_observer(config_));

  const std::filesystem::path db_path = common::expand_path(config_.state.db_path);
  if (db_path.has_parent_path()) {
    if (auto dir = common::ensure_dir(db_path.parent_path()); !dir.ok()) {
      return common::Result<Services>::failure(dir.details());
    }
  }
  auto state = std::make_shared<storage::SqliteStateStore>(db_path);
  if (!state->is_open()) {
    return common::Result<Services>::failure("failed to open state database " + db_path.string());
  }

  const std::filesystem::path blob_root = common::expand_path(config_.logs.blob_root);
  if (auto dir = common::ensure_dir(blob_root); !dir.ok()) {
    return common::Result<Services>::failure(dir.details());
  }

  Services services;
  services.state = state;
  services.blobs = std::make_shared<storage::LocalBlobStore>(blob_root);
  services.http = std::make_shared<net::CurlHttpClient>();
  services.sandboxes = std::make_shared<sandbox::DockerSandboxProvider>(
      config_.sandbox, std::make_shared<sandbox::DockerCliRunner>(), services.http);
  services.config_source =
      std::make_shared<tenant::HttpConfigSource>(config_.control_plane, services.http);

  const auto clock = common::system_clock();
  services.scheduler = std::make_shared<lifecycle::AlarmScheduler>(services.state, clock);
  services.registry = create_registry(config_,
                                      tenant::ControllerDeps{
                                          .sandboxes = services.sandboxes,
                                          .config_source = services.config_source,
                                          .state = services.state,
                                          .blobs = services.blobs,
                                          .clock = clock,
                                          .sleeper = common::thread_sleeper(),
                                          .schedule_alarm = {},
                                      },
                                      services.scheduler);

  auto restored = services.scheduler->restore();
  if (!restored.ok()) {
    return common::Result<Services>::failure(restored.details());
  }
  if (restored.value() > 0) {
    observability::record_notice("scheduler", "restored " + std::to_string(restored.value()) +
                                                  " pending alarms");
  }
  return common::Result<Services>::success(std::move(services));
}

} // namespace warden::runtime
