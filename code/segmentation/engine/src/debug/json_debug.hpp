#pragma once
#include <algorithm>
#include <cstddef>
#include <string>

// Where a JSON parse failed, in editor terms.
struct JsonErrorLocation {
  std::size_t line = 1;   // 1-based
  std::size_t column = 1; // 1-based, counted in bytes
  std::string snippet;    // the offending line with a caret under the column
};

// nlohmann's parse_error::byte is 1-based and may point one past the end.
inline JsonErrorLocation locate_json_error(const std::string &text,
                                           std::size_t byte) {
  const std::size_t pos = std::min(byte > 0 ? byte - 1 : 0, text.size());

  JsonErrorLocation loc;
  std::size_t line_start = 0;
  for (std::size_t i = 0; i < pos; ++i) {
    if (text[i] == '\n') {
      ++loc.line;
      line_start = i + 1;
    }
  }
  loc.column = pos - line_start + 1;

  std::size_t line_end = text.find('\n', line_start);
  if (line_end == std::string::npos)
    line_end = text.size();
  // long single-line files: keep at most 60 bytes either side
  const std::size_t from =
      (pos - line_start > 60) ? pos - 60 : line_start;
  const std::size_t to = std::min(line_end, pos + 60);
  loc.snippet = text.substr(from, to - from);
  loc.snippet += "\n" + std::string(pos - from, ' ') + "^";
  return loc;
}

// "path:line:col: what" followed by the snippet.
inline std::string describe_json_error(const std::string &path,
                                       const std::string &text,
                                       std::size_t byte,
                                       const std::string &what) {
  const JsonErrorLocation loc = locate_json_error(text, byte);
  return path + ":" + std::to_string(loc.line) + ":" +
         std::to_string(loc.column) + ": " + what + "\n" + loc.snippet;
}
