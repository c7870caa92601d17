#include "test_framework.hpp"

#include "warden/config/schema.hpp"
#include "warden/doctor/diagnostics.hpp"
#include "warden/health/health.hpp"
#include "warden/observability/factory.hpp"
#include "warden/observability/global.hpp"
#include "warden/observability/multi_observer.hpp"
#include "warden/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int errors = 0;
};

class CountingObserver final : public warden::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const warden::observability::ObserverEvent &event) override {
    ++state_->events;
    if (std::holds_alternative<warden::observability::ErrorEvent>(event)) {
      ++state_->errors;
    }
  }
  void record_metric(const warden::observability::ObserverMetric &) override { ++state_->metrics; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

const warden::doctor::DiagnosticCheck *find_check(const warden::doctor::DiagnosticsReport &report,
                                                  const std::string &name) {
  for (const auto &check : report.checks) {
    if (check.name == name) {
      return &check;
    }
  }
  return nullptr;
}

} // namespace

void register_observability_health_doctor_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace ob = warden::observability;
  namespace hl = warden::health;
  namespace dr = warden::doctor;
  namespace wt = warden::testing;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_agent_start("tenant-acme", std::chrono::milliseconds(40), true, 2);
                     ob::record_proxy("acme", "/chat", 200, false);
                     ob::record_metric(ob::TokensUsedMetric{.tokens = 42});

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     multi->add(std::make_unique<CountingObserver>(&one));
                     multi->add(std::make_unique<CountingObserver>(&two));

                     ob::set_global_observer(std::move(multi));
                     ob::record_error("unit", "boom");
                     ob::record_sandbox("tenant-acme", "destroy", true, "idle");
                     ob::record_metric(ob::LogBufferDepthMetric{.depth = 3});

                     require(one.events == 2 && two.events == 2, "events should be forwarded");
                     require(one.errors == 1, "error event should keep its type");
                     require(one.metrics == 1 && two.metrics == 1, "metric should be forwarded");

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_without_global_is_silent", [] {
                     ob::set_global_observer(nullptr);
                     ob::record_lifecycle("tenant-acme", "evicted");
                     ob::record_metric(ob::ActiveSandboxesMetric{.count = 0});
                     require(ob::get_global_observer() == nullptr, "no observer installed");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     warden::config::Config config;
                     config.observability.backend = "none";
                     auto none = ob::create_observer(config);
                     require(none->name() == "noop", "none backend should map to noop");

                     config.observability.backend = "LOG";
                     auto log = ob::create_observer(config);
                     require(log->name() == "log", "log backend should map to log observer");

                     config.observability.backend = "log, noop";
                     auto multi = ob::create_observer(config);
                     require(multi->name() == "multi", "comma backend should map to multi observer");
                     require(static_cast<ob::MultiObserver *>(multi.get())->size() == 2,
                             "both backends should be attached");
                   }});

  tests.push_back({"health_tracks_component_state", [] {
                     auto clock = std::make_shared<wt::ManualClock>();
                     hl::set_clock(clock);
                     hl::clear();
                     hl::mark_component_starting("gateway");
                     hl::mark_component_ok("gateway");
                     hl::bump_component_restart(hl::sandbox_component("tenant-acme"));
                     hl::mark_component_error(hl::sandbox_component("tenant-acme"), "agent down");

                     auto gateway = hl::get_component("gateway");
                     require(gateway.has_value(), "gateway should exist");
                     require(gateway->state == hl::ComponentState::Ok, "gateway status should be ok");
                     require(gateway->last_ok == wt::fixed_time(), "gateway should track last_ok");

                     const auto sandbox = hl::get_component("sandbox:tenant-acme");
                     require(sandbox.has_value() && sandbox->restart_count == 1,
                             "sandbox restart count mismatch");

                     clock->advance(std::chrono::seconds(90));
                     const auto snap = hl::snapshot();
                     require(snap.services.size() == 1 && snap.sandboxes.contains("tenant-acme"),
                             "sandboxes are grouped apart from services");
                     require(snap.uptime == std::chrono::seconds(90), "uptime mismatch");

                     const auto json = hl::snapshot_json();
                     require(json.rfind("{\"status\":\"degraded\"", 0) == 0,
                             "an errored sandbox degrades the snapshot: " + json);
                     require(json.find("\"sandboxes\":{\"total\":1,\"ready\":0,\"failing\":1}") !=
                                 std::string::npos,
                             "sandbox rollup mismatch: " + json);
                     require(json.find("\"last_error\":\"agent down\"") != std::string::npos,
                             "last error should be reported");

                     hl::reset_component("sandbox:tenant-acme");
                     require(hl::snapshot_json().rfind("{\"status\":\"ok\"", 0) == 0,
                             "reset should clear the degradation");
                     hl::clear();
                     hl::set_clock(nullptr);
                   }});

  tests.push_back({"doctor_reports_every_check", [] {
                     const wt::TempWorkspace workspace;
                     auto config = wt::mock_config();
                     config.state.db_path = (workspace.path() / "state.db").string();
                     config.logs.blob_root = (workspace.path() / "blobs").string();

                     auto docker = std::make_shared<wt::FakeDockerRunner>();
                     docker->responder = [](const std::vector<std::string> &) {
                       return warden::common::Result<warden::sandbox::DockerProcessResult>::success(
                           warden::sandbox::DockerProcessResult{.exit_code = 0, .stdout_text = "27.1.1\n"});
                     };
                     auto http = std::make_shared<wt::FakeHttpClient>();

                     const auto report = dr::run_diagnostics(config, dr::DoctorDeps{.docker = docker, .http = http});
                     require(report.checks.size() == 5, "five checks expected");
                     require(report.passed + report.failed + report.warnings ==
                                 static_cast<int>(report.checks.size()),
                             "summary counts should match checks");
                     require(find_check(report, "Docker")->status == dr::CheckStatus::Pass,
                             "docker should pass");
                     require(find_check(report, "Docker")->message.find("27.1.1") != std::string::npos,
                             "server version should be shown");
                     require(find_check(report, "State DB")->status == dr::CheckStatus::Pass,
                             "state db should open");
                     require(find_check(report, "Blob Root")->status == dr::CheckStatus::Pass,
                             "blob root should be writable");
                     require(find_check(report, "Config Service")->status == dr::CheckStatus::Pass,
                             "config service should be reachable");
                     require(http->requests.front().url == "http://control-plane.test",
                             "config service url mismatch");
                   }});

  tests.push_back({"doctor_flags_unreachable_dependencies", [] {
                     const wt::TempWorkspace workspace;
                     auto config = wt::mock_config();
                     config.state.db_path = (workspace.path() / "state.db").string();
                     config.logs.blob_root = (workspace.path() / "blobs").string();
                     config.control_plane.url.clear();

                     auto docker = std::make_shared<wt::FakeDockerRunner>();
                     docker->responder = [](const std::vector<std::string> &) {
                       return warden::common::Result<warden::sandbox::DockerProcessResult>::success(
                           warden::sandbox::DockerProcessResult{
                               .exit_code = 1, .stderr_text = "Cannot connect to the Docker daemon"});
                     };
                     auto http = std::make_shared<wt::FakeHttpClient>();

                     const auto report = dr::run_diagnostics(config, dr::DoctorDeps{.docker = docker, .http = http});
                     require(find_check(report, "Docker")->status == dr::CheckStatus::Fail,
                             "docker should fail");
                     require(find_check(report, "Docker")->message.find("Docker daemon") !=
                                 std::string::npos,
                             "docker stderr should be shown");
                     require(find_check(report, "Config Service")->status == dr::CheckStatus::Warn,
                             "missing url is a warning");
                     require(http->requests.empty(), "no request without a url");
                     require(report.failed >= 1, "failure should be counted");
                   }});
}
