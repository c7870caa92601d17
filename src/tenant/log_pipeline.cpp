#include "warden/tenant/log_pipeline.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"
#include "warden/observability/global.hpp"

#include <chrono>
#include <sstream>

namespace warden::tenant {

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "info";
}

LogLevel classify_log_line(const std::string &line) {
  const std::string lowered = common::to_lower(line);
  if (lowered.find("error") != std::string::npos || lowered.find("fail") != std::string::npos) {
    return LogLevel::Error;
  }
  if (lowered.find("warn") != std::string::npos) {
    return LogLevel::Warn;
  }
  return LogLevel::Info;
}

std::string render_log_entry(const LogEntry &entry) {
  return "{\"ts\":" + common::json_string(common::format_rfc3339(entry.timestamp)) +
         ",\"level\":" + common::json_string(std::string(log_level_name(entry.level))) +
         ",\"msg\":" + common::json_string(entry.message) +
         ",\"tenant\":" + common::json_string(entry.tenant_id) + "}";
}

LogPipeline::LogPipeline(config::LogsConfig config, std::string log_path,
                         std::shared_ptr<storage::IBlobStore> blobs,
                         std::shared_ptr<common::Clock> clock)
    : config_(std::move(config)), log_path_(std::move(log_path)), blobs_(std::move(blobs)),
      clock_(std::move(clock)) {}

std::string LogPipeline::tenant_prefix(const std::string &tenant_id) {
  return "logs/" + common::url_encode(tenant_id) + "/";
}

common::Status LogPipeline::pull_and_buffer(sandbox::ISandbox &sandbox,
                                            const std::string &tenant_id) {
  const std::string command = "tail -n +" + std::to_string(offset_ + 1) + " " +
                              common::shell_quote(log_path_) + " 2>/dev/null | head -n " +
                              std::to_string(config_.max_lines_per_pull);
  auto result = sandbox.exec(command);
  if (!result.ok()) {
    return common::Status::error("log pull failed: " + result.error());
  }

  const std::string &text = result.value().stdout_text;
  std::size_t start = 0;
  std::size_t newline = text.find('\n');
  common::Status flushed = common::Status::success();
  while (newline != std::string::npos) {
    std::string line = text.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    ++offset_;
    if (!common::trim(line).empty()) {
      buffer_.push_back(LogEntry{.timestamp = clock_->now(),
                                 .level = classify_log_line(line),
                                 .message = std::move(line),
                                 .tenant_id = tenant_id});
      if (buffer_.size() >= config_.buffer_cap) {
        if (auto status = flush(tenant_id); !status.ok()) {
          flushed = status;
        }
      }
    }
    start = newline + 1;
    newline = text.find('\n', start);
  }

  observability::record_metric(observability::LogBufferDepthMetric{.depth = buffer_.size()});
  return flushed;
}

common::Status LogPipeline::flush(const std::string &tenant_id) {
  if (buffer_.empty()) {
    return common::Status::success();
  }

  std::ostringstream body;
  for (const auto &entry : buffer_) {
    body << render_log_entry(entry) << "\n";
  }
  const auto now = clock_->now();
  const std::string key = tenant_prefix(tenant_id) + common::format_date(now) + "/" +
                          std::to_string(common::to_unix_ms(now)) + "-" +
                          std::to_string(batch_sequence_++) + ".ndjson";
  const std::size_t count = buffer_.size();
  buffer_.clear();

  auto status = blobs_->put(key, body.str(),
                            {{"entryCount", std::to_string(count)}, {"tenantId", tenant_id}});
  if (!status.ok()) {
    observability::record_error("logs", "flush for " + tenant_id + " failed, dropped " +
                                            std::to_string(count) + " entries: " + status.error());
    return common::Status::error(status.error(), common::ErrorKind::Flush);
  }
  observability::record_log_flush(tenant_id, count, key);
  return common::Status::success();
}

common::Result<std::size_t> LogPipeline::cleanup_old(const std::string &tenant_id) {
  const std::string prefix = tenant_prefix(tenant_id);
  auto objects = blobs_->list(prefix);
  if (!objects.ok()) {
    return common::Result<std::size_t>::failure(objects.error());
  }

  const auto today = common::parse_date(common::format_date(clock_->now()));
  if (!today.has_value()) {
    return common::Result<std::size_t>::failure("unable to compute retention cutoff");
  }
  const auto cutoff = *today - std::chrono::hours(24) * config_.retention_days;

  std::size_t deleted = 0;
  for (const auto &object : objects.value()) {
    const std::string rest = object.key.substr(prefix.size());
    const auto date = common::parse_date(rest.substr(0, rest.find('/')));
    if (!date.has_value() || *date >= cutoff) {
      continue;
    }
    if (auto removed = blobs_->remove(object.key); !removed.ok()) {
      observability::record_error("logs", "retention delete of " + object.key +
                                              " failed: " + removed.error());
      continue;
    }
    ++deleted;
  }
  return common::Result<std::size_t>::success(deleted);
}

void LogPipeline::reset() {
  offset_ = 0;
  buffer_.clear();
}

} // namespace warden::tenant
