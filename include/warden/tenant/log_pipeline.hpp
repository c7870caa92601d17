#pragma once

#include "warden/common/clock.hpp"
#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/storage/blob_store.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace warden::tenant {

enum class LogLevel { Info, Warn, Error };

[[nodiscard]] std::string_view log_level_name(LogLevel level);
/// "error"/"fail" anywhere (case-insensitive) is an error, "warn" a warning.
[[nodiscard]] LogLevel classify_log_line(const std::string &line);

struct LogEntry {
  common::TimePoint timestamp;
  LogLevel level = LogLevel::Info;
  std::string message;
  std::string tenant_id;
};

[[nodiscard]] std::string render_log_entry(const LogEntry &entry);

/// Pulls the agent log by line offset into a bounded buffer and flushes batches to
/// blob storage under logs/<tenant>/<YYYY-MM-DD>/.
class LogPipeline {
public:
  LogPipeline(config::LogsConfig config, std::string log_path,
              std::shared_ptr<storage::IBlobStore> blobs, std::shared_ptr<common::Clock> clock);

  /// Reads lines past the offset; only newline-terminated lines are consumed. Flushes
  /// whenever the buffer reaches its cap.
  [[nodiscard]] common::Status pull_and_buffer(sandbox::ISandbox &sandbox,
                                               const std::string &tenant_id);
  /// Writes the buffer as one NDJSON object and clears it. On failure the buffer is
  /// discarded as well.
  [[nodiscard]] common::Status flush(const std::string &tenant_id);
  /// Deletes batches whose date partition is older than the retention window.
  [[nodiscard]] common::Result<std::size_t> cleanup_old(const std::string &tenant_id);

  /// Forgets the offset and any buffered entries; used after the sandbox is destroyed.
  void reset();

  [[nodiscard]] std::size_t offset() const { return offset_; }
  [[nodiscard]] std::size_t buffered() const { return buffer_.size(); }

  [[nodiscard]] static std::string tenant_prefix(const std::string &tenant_id);

private:
  config::LogsConfig config_;
  std::string log_path_;
  std::shared_ptr<storage::IBlobStore> blobs_;
  std::shared_ptr<common::Clock> clock_;
  std::size_t offset_ = 0;
  std::vector<LogEntry> buffer_;
  std::uint64_t batch_sequence_ = 0;
};

} // namespace warden::tenant
