#include "warden/doctor/diagnostics.hpp"

#include "warden/common/fs.hpp"
#include "warden/config/config.hpp"
#include "warden/lifecycle/alarm_scheduler.hpp"
#include "warden/storage/state_store.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

namespace warden::doctor {

namespace {

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "valid";
  return check;
}

DiagnosticCheck check_docker(const config::Config &config, sandbox::IDockerRunner &docker) {
  DiagnosticCheck check;
  check.name = "Docker";

  const auto start = std::chrono::steady_clock::now();
  auto version = docker.run({"version", "--format", "{{.Server.Version}}"},
                            {.allow_failure = true, .timeout = config.sandbox.docker_timeout});
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  if (!version.ok()) {
    check.status = CheckStatus::Fail;
    check.message = version.error();
    return check;
  }
  if (version.value().exit_code != 0) {
    check.status = CheckStatus::Fail;
    const std::string detail = common::trim(version.value().stderr_text);
    check.message = detail.empty() ? "docker daemon unreachable" : detail;
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "server " + common::trim(version.value().stdout_text) + ", image " +
                  config.sandbox.image;
  return check;
}

DiagnosticCheck check_state_db(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "State DB";
  const std::filesystem::path path = common::expand_path(config.state.db_path);
  if (path.has_parent_path()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      check.status = CheckStatus::Fail;
      check.message = dir.error();
      return check;
    }
  }

  storage::SqliteStateStore store(path);
  if (!store.is_open()) {
    check.status = CheckStatus::Fail;
    check.message = "cannot open " + path.string();
    return check;
  }
  auto alarms = store.find_key(lifecycle::ALARM_KEY);
  if (!alarms.ok()) {
    check.status = CheckStatus::Fail;
    check.message = alarms.error();
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = path.string() + " (" + std::to_string(alarms.value().size()) + " pending alarms)";
  return check;
}

DiagnosticCheck check_blob_root(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Blob Root";
  const std::filesystem::path root = common::expand_path(config.logs.blob_root);
  if (auto dir = common::ensure_dir(root); !dir.ok()) {
    check.status = CheckStatus::Fail;
    check.message = dir.error();
    return check;
  }

  const auto probe = root / ".doctor-probe";
  if (auto written = common::write_file_atomic(probe, "ok"); !written.ok()) {
    check.status = CheckStatus::Fail;
    check.message = "not writable: " + written.error();
    return check;
  }
  std::error_code ec;
  std::filesystem::remove(probe, ec);

  check.status = CheckStatus::Pass;
  check.message = root.string();
  return check;
}

DiagnosticCheck check_config_service(const config::Config &config, net::HttpClient &http) {
  DiagnosticCheck check;
  check.name = "Config Service";
  const std::string url = common::trim(config.control_plane.url);
  if (url.empty()) {
    check.status = CheckStatus::Warn;
    check.message = "control_plane.url not set; tenants get empty configuration";
    return check;
  }
  if (common::trim(config.control_plane.internal_key).empty()) {
    check.status = CheckStatus::Warn;
    check.message = "control_plane.internal_key not set; tenants get empty configuration";
    return check;
  }

  const auto start = std::chrono::steady_clock::now();
  const auto response = http.get(url, {}, config.control_plane.timeout);
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (response.failed()) {
    check.status = CheckStatus::Fail;
    check.message = response.timeout ? "timed out" : response.network_error_message;
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = url + " reachable (HTTP " + std::to_string(response.status) + ")";
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const config::Config &config, const DoctorDeps &deps) {
  DiagnosticsReport report;
  add_check(report, check_config(config));
  add_check(report, check_docker(config, *deps.docker));
  add_check(report, check_state_db(config));
  add_check(report, check_blob_root(config));
  add_check(report, check_config_service(config, *deps.http));
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    std::cout << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      std::cout << " (" << check.latency->count() << "ms)";
    }
    std::cout << "\n";
  }

  std::cout << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
            << report.warnings << " warnings\n";
}

} // namespace warden::doctor
