#pragma once

#include <functional>
#include <string>

namespace a2a::net {

// SSE event
struct SseEvent {
  std::string event;  // Event type (empty for default "message")
  std::string data;   // Event data, multi-line data joined with '\n'
  std::string id;     // Event ID (optional)
};

// Incremental text/event-stream parser. Chunks may split events, lines or
// even the "\r\n" pair anywhere; complete events are delivered in order.
class SseParser {
 public:
  explicit SseParser(std::function<void(const SseEvent&)> on_event) : on_event_(std::move(on_event)) {}

  void feed(const std::string& chunk);

  // Delivers a trailing event that was not terminated by a blank line
  void finish();

 private:
  void process_line(std::string line);
  void dispatch();

  std::function<void(const SseEvent&)> on_event_;
  std::string pending_;
  SseEvent current_;
  std::string data_;
  bool has_data_ = false;
};

// "data: <payload>\n\n"; embedded newlines become separate data lines
std::string format_sse_event(const std::string& data);

}  // namespace a2a::net
