#include "warden/sandbox/diagnostics.hpp"

#include "warden/common/fs.hpp"

#include <sstream>

namespace warden::sandbox {

namespace {

std::string run_or_describe(ISandbox &sandbox, const std::string &command) {
  auto result = sandbox.exec(command);
  if (!result.ok()) {
    return "(unavailable: " + result.error() + ")";
  }
  std::string text = result.value().stdout_text;
  if (!result.value().stderr_text.empty()) {
    text += result.value().stderr_text;
  }
  if (common::trim(text).empty()) {
    return "(empty, exit " + std::to_string(result.value().exit_code) + ")";
  }
  return text;
}

} // namespace

std::string collect_log_tail(ISandbox &sandbox, const std::string &log_path,
                             const std::size_t lines) {
  return run_or_describe(sandbox, "tail -n " + std::to_string(lines) + " " +
                                      common::shell_quote(log_path) + " 2>&1");
}

DiagnosticsBundle collect_diagnostics(ISandbox &sandbox, const std::string &log_path) {
  DiagnosticsBundle bundle;
  bundle.log_tail = collect_log_tail(sandbox, log_path);
  bundle.processes = run_or_describe(sandbox, "ps aux 2>&1");
  bundle.ports = run_or_describe(sandbox, "ss -tulpn 2>&1 || netstat -tulpn 2>&1");
  return bundle;
}

std::string DiagnosticsBundle::to_string() const {
  std::ostringstream out;
  out << "=== agent log (tail) ===\n" << (log_tail.empty() ? "(none)" : log_tail) << "\n";
  out << "=== processes ===\n" << (processes.empty() ? "(none)" : processes) << "\n";
  out << "=== listening ports ===\n" << (ports.empty() ? "(none)" : ports) << "\n";
  return out.str();
}

} // namespace warden::sandbox
