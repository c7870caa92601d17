#include "warden/cli/commands.hpp"

#include "warden/common/fs.hpp"
#include "warden/config/config.hpp"
#include "warden/doctor/diagnostics.hpp"
#include "warden/gateway/server.hpp"
#include "warden/lifecycle/alarm_scheduler.hpp"
#include "warden/net/http_client.hpp"
#include "warden/observability/global.hpp"
#include "warden/runtime/app.hpp"
#include "warden/sandbox/docker.hpp"
#include "warden/storage/state_store.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace warden::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) { g_stop_requested = true; }

std::string version_string() {
#ifdef WARDEN_VERSION
  std::string version = WARDEN_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "warden " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

int run_serve(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }

  std::string host;
  std::string port_raw;
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  if (!host.empty()) {
    context.value().mutable_config().gateway.host = host;
  }
  if (!port_raw.empty()) {
    std::uint16_t port = 0;
    const auto [ptr, ec] = std::from_chars(port_raw.data(), port_raw.data() + port_raw.size(), port);
    if (ec != std::errc() || ptr != port_raw.data() + port_raw.size()) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
    context.value().mutable_config().gateway.port = port;
  }

  const auto &config = context.value().config();
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    std::cerr << "invalid configuration: " << validation.error() << "\n";
    return 1;
  }

  auto services = context.value().create_services();
  if (!services.ok()) {
    std::cerr << services.error() << "\n";
    return 1;
  }
  for (const auto &warning : validation.value()) {
    observability::record_notice("config", warning);
  }

  gateway::GatewayServer server(config, services.value().registry);
  auto started =
      server.start({.host = config.gateway.host, .port = config.gateway.port});
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  services.value().scheduler->start();

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
  std::signal(SIGPIPE, SIG_IGN);
  std::cout << "warden listening on " << config.gateway.host << ":" << server.port() << "\n";
  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "shutting down\n";
  server.stop();
  services.value().scheduler->stop();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_doctor() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto report = doctor::run_diagnostics(
      context.value().config(),
      doctor::DoctorDeps{.docker = std::make_shared<sandbox::DockerCliRunner>(),
                         .http = std::make_shared<net::CurlHttpClient>()});
  doctor::print_diagnostics_report(report);
  return report.failed == 0 ? 0 : 1;
}

int run_alarms(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const std::filesystem::path db_path = common::expand_path(context.value().config().state.db_path);
  auto store = std::make_shared<storage::SqliteStateStore>(db_path);
  if (!store->is_open()) {
    std::cerr << "failed to open state database " << db_path.string() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "list") {
    auto alarms = store->find_key(lifecycle::ALARM_KEY);
    if (!alarms.ok()) {
      std::cerr << alarms.error() << "\n";
      return 1;
    }
    for (const auto &[name, value] : alarms.value()) {
      std::int64_t deadline_ms = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), deadline_ms);
      const bool valid = ec == std::errc() && ptr == value.data() + value.size();
      std::cout << name << " | "
                << (valid ? common::format_rfc3339(common::from_unix_ms(deadline_ms))
                          : "corrupt: " + value)
                << "\n";
    }
    return 0;
  }

  if (args[0] == "cancel") {
    if (args.size() < 2) {
      std::cerr << "usage: warden alarms cancel <sandbox-name>\n";
      return 1;
    }
    lifecycle::AlarmScheduler scheduler(store, common::system_clock());
    if (auto cancelled = scheduler.cancel(args[1]); !cancelled.ok()) {
      std::cerr << cancelled.error() << "\n";
      return 1;
    }
    std::cout << "cancelled alarm for " << args[1] << "\n";
    return 0;
  }

  std::cerr << "unknown alarms command: " << args[0] << "\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: warden [--config <path>] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  serve [--host H] [--port P]  Run the tenant gateway and lifecycle scheduler\n";
  std::cout << "  doctor                       Check docker, storage and the config service\n";
  std::cout << "  alarms [list|cancel <name>]  Inspect wake-ups persisted in the state database\n";
  std::cout << "  config-path                  Print the resolved configuration file path\n";
  std::cout << "  version                      Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }
  if (subcommand == "alarms") {
    return run_alarms(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace warden::cli
