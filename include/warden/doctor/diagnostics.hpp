#pragma once

#include "warden/config/schema.hpp"
#include "warden/net/http_client.hpp"
#include "warden/sandbox/docker.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

struct DoctorDeps {
  std::shared_ptr<sandbox::IDockerRunner> docker;
  std::shared_ptr<net::HttpClient> http;
};

[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config,
                                                const DoctorDeps &deps);
void print_diagnostics_report(const DiagnosticsReport &report);

} // namespace warden::doctor
