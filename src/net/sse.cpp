#include "a2a/net/sse.hpp"

#include <sstream>

namespace a2a::net {

namespace {

// "field: value" -> value, with the single optional leading space removed
std::string field_value(const std::string& line, size_t prefix_len) {
  std::string value = line.substr(prefix_len);
  if (!value.empty() && value[0] == ' ') {
    value.erase(0, 1);
  }
  return value;
}

}  // namespace

void SseParser::feed(const std::string& chunk) {
  pending_ += chunk;

  size_t pos;
  while ((pos = pending_.find('\n')) != std::string::npos) {
    std::string line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);
    process_line(std::move(line));
  }
}

void SseParser::finish() {
  if (!pending_.empty()) {
    process_line(std::move(pending_));
    pending_.clear();
  }
  dispatch();
}

void SseParser::process_line(std::string line) {
  // Remove carriage return if present
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  // End of event
  if (line.empty()) {
    dispatch();
    return;
  }

  if (line.starts_with(":")) {
    return;  // comment
  } else if (line.starts_with("event:")) {
    current_.event = field_value(line, 6);
  } else if (line.starts_with("data:")) {
    if (has_data_) data_ += "\n";
    data_ += field_value(line, 5);
    has_data_ = true;
  } else if (line.starts_with("id:")) {
    current_.id = field_value(line, 3);
  }
}

void SseParser::dispatch() {
  if (has_data_) {
    current_.data = std::move(data_);
    if (on_event_) on_event_(current_);
  }
  current_ = SseEvent{};
  data_.clear();
  has_data_ = false;
}

std::string format_sse_event(const std::string& data) {
  std::ostringstream out;
  std::istringstream lines(data);
  std::string line;
  bool any = false;
  while (std::getline(lines, line)) {
    out << "data: " << line << "\n";
    any = true;
  }
  if (!any) {
    out << "data: \n";
  }
  out << "\n";
  return out.str();
}

}  // namespace a2a::net
