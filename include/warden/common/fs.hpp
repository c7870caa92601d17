#pragma once

#include "warden/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace warden::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Writes through a sibling temp file and renames it over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &content);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Single-quotes a value for POSIX sh.
[[nodiscard]] std::string shell_quote(const std::string &value);

/// Percent-encodes a query or path component.
[[nodiscard]] std::string url_encode(const std::string &value);
[[nodiscard]] std::string url_decode(const std::string &value);

} // namespace warden::common
