#include "warden/tenant/stream_events.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

#include <charconv>

namespace warden::tenant {

namespace {

std::uint64_t parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc()) {
    return 0;
  }
  return value;
}

} // namespace

StreamEvent parse_stream_event(const std::string &line) {
  StreamEvent event;
  const auto members = common::json_object_members(line);
  const std::string type = common::json_value_as_string(common::json_member(members, "type"));

  if (type == "start") {
    event.type = StreamEventType::Start;
  } else if (type == "stream") {
    event.type = StreamEventType::TextDelta;
    const auto inner = common::json_object_members(common::json_member(members, "event"));
    const auto delta = common::json_object_members(common::json_member(inner, "delta"));
    event.text = common::json_value_as_string(common::json_member(delta, "text"));
  } else if (type == "tool_use") {
    event.type = StreamEventType::ToolUse;
    event.tool_name = common::json_value_as_string(common::json_member(members, "name"));
  } else if (type == "done") {
    event.type = StreamEventType::Done;
    const auto usage = common::json_object_members(common::json_member(members, "usage"));
    event.input_tokens = parse_u64(common::json_member(usage, "inputTokens"));
    event.output_tokens = parse_u64(common::json_member(usage, "outputTokens"));
  } else if (type == "error") {
    event.type = StreamEventType::Error;
    event.error = common::json_value_as_string(common::json_member(members, "message"));
    if (event.error.empty()) {
      event.error = common::json_value_as_string(common::json_member(members, "error"));
    }
  }
  return event;
}

std::vector<StreamEvent> StreamEventScanner::feed(const std::string_view chunk) {
  std::vector<StreamEvent> events;
  partial_.append(chunk.data(), chunk.size());

  std::size_t start = 0;
  std::size_t newline = partial_.find('\n');
  while (newline != std::string::npos) {
    const std::string line = common::trim(partial_.substr(start, newline - start));
    if (!line.empty()) {
      events.push_back(parse_stream_event(line));
      observe(events.back());
    }
    start = newline + 1;
    newline = partial_.find('\n', start);
  }
  partial_.erase(0, start);
  return events;
}

std::vector<StreamEvent> StreamEventScanner::finish() {
  std::vector<StreamEvent> events;
  const std::string line = common::trim(partial_);
  partial_.clear();
  if (!line.empty()) {
    events.push_back(parse_stream_event(line));
    observe(events.back());
  }
  return events;
}

void StreamEventScanner::observe(const StreamEvent &event) {
  if (event.type == StreamEventType::Done) {
    saw_done_ = true;
    total_tokens_ += event.input_tokens + event.output_tokens;
  } else if (event.type == StreamEventType::Error) {
    saw_error_ = true;
  }
}

std::string stream_interrupted_line(const std::string &message) {
  return "{\"type\":\"error\",\"error\":\"stream_interrupted\",\"message\":" +
         common::json_string(message) + "}\n";
}

} // namespace warden::tenant
