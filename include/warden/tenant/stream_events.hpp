#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace warden::tenant {

enum class StreamEventType { Start, TextDelta, ToolUse, Done, Error, Other };

struct StreamEvent {
  StreamEventType type = StreamEventType::Other;
  std::string text;
  std::string tool_name;
  std::string error;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
};

[[nodiscard]] StreamEvent parse_stream_event(const std::string &line);

/// Splits relayed NDJSON bytes into complete lines and classifies each. Bytes are
/// never modified; the scanner only observes them.
class StreamEventScanner {
public:
  [[nodiscard]] std::vector<StreamEvent> feed(std::string_view chunk);
  /// Classifies a trailing line that arrived without a newline.
  [[nodiscard]] std::vector<StreamEvent> finish();

  [[nodiscard]] bool saw_done() const { return saw_done_; }
  [[nodiscard]] bool saw_error() const { return saw_error_; }
  [[nodiscard]] std::uint64_t total_tokens() const { return total_tokens_; }

private:
  void observe(const StreamEvent &event);

  std::string partial_;
  bool saw_done_ = false;
  bool saw_error_ = false;
  std::uint64_t total_tokens_ = 0;
};

/// The terminal line appended when the upstream stream breaks after it started.
[[nodiscard]] std::string stream_interrupted_line(const std::string &message);

} // namespace warden::tenant
