#include "verify/output_normalizer.hpp"

#include <cctype>
#include <utility>

namespace nucleobench::verify {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && IsSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

// Length of `<ws+><digits+><ws+>` starting at `pos`, or 0 when absent.
std::size_t MatchCounter(std::string_view text, std::size_t pos) {
  std::size_t cursor = pos;
  const std::size_t ws1 = cursor;
  while (cursor < text.size() && IsSpace(text[cursor])) {
    ++cursor;
  }
  if (cursor == ws1) {
    return 0;
  }
  const std::size_t digits = cursor;
  while (cursor < text.size() && IsDigit(text[cursor])) {
    ++cursor;
  }
  if (cursor == digits) {
    return 0;
  }
  const std::size_t ws2 = cursor;
  while (cursor < text.size() && IsSpace(text[cursor])) {
    ++cursor;
  }
  if (cursor == ws2) {
    return 0;
  }
  return cursor - pos;
}

// Rewrites every `<marker><ws+><digits+><ws+>` occurrence to `<marker> `,
// scanning left to right without overlapping matches.
std::string CollapseCounters(std::string_view line, std::string_view marker) {
  std::string out;
  out.reserve(line.size());
  std::size_t pos = 0;
  while (pos < line.size()) {
    const std::size_t hit = line.find(marker, pos);
    if (hit == std::string_view::npos) {
      out.append(line.substr(pos));
      break;
    }
    out.append(line.substr(pos, hit - pos));
    out.append(marker);
    const std::size_t after_marker = hit + marker.size();
    const std::size_t counter_len = MatchCounter(line, after_marker);
    if (counter_len > 0U) {
      out.push_back(' ');
      pos = after_marker + counter_len;
    } else {
      pos = after_marker;
    }
  }
  return out;
}

} // namespace

bool NormalizeConsoleLine(std::string_view line, std::string_view marker, std::string& payload) {
  payload.clear();
  if (marker.empty() || line.find(marker) == std::string_view::npos) {
    return false;
  }

  std::string normalized = CollapseCounters(TrimView(line), marker);
  const std::string prefix = std::string(marker) + " ";
  if (normalized.compare(0, prefix.size(), prefix) == 0) {
    normalized.erase(0, prefix.size());
  }
  if (normalized.empty()) {
    return false;
  }
  payload = std::move(normalized);
  return true;
}

std::vector<std::string> NormalizeConsoleOutput(std::string_view raw_capture,
                                                std::string_view marker) {
  std::vector<std::string> lines;
  std::size_t cursor = 0;
  while (cursor < raw_capture.size()) {
    std::size_t line_end = raw_capture.find('\n', cursor);
    if (line_end == std::string_view::npos) {
      line_end = raw_capture.size();
    }
    std::string payload;
    if (NormalizeConsoleLine(raw_capture.substr(cursor, line_end - cursor), marker, payload)) {
      lines.push_back(std::move(payload));
    }
    cursor = line_end + 1;
  }
  return lines;
}

} // namespace nucleobench::verify
