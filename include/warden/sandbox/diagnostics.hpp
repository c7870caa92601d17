#pragma once

#include "warden/sandbox/sandbox.hpp"

#include <string>

namespace warden::sandbox {

struct DiagnosticsBundle {
  std::string log_tail;
  std::string processes;
  std::string ports;

  /// Never empty: sections that could not be collected say so.
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string collect_log_tail(ISandbox &sandbox, const std::string &log_path,
                                           std::size_t lines = 50);
[[nodiscard]] DiagnosticsBundle collect_diagnostics(ISandbox &sandbox, const std::string &log_path);

} // namespace warden::sandbox
