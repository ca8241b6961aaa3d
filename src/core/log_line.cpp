/**
 * @file log_line.cpp
 * @brief Splitting log buffers into numbered lines
 */

#include "core/log_line.hpp"

namespace latexerr {

std::vector<log_line> split_log_lines(const std::string &text) {
  std::vector<log_line> lines;
  std::size_t start = 0;

  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }

    std::string content = text.substr(start, end - start);
    if (!content.empty() && content.back() == '\r') {
      content.pop_back();
    }

    lines.push_back({lines.size() + 1, std::move(content)});
    start = end + 1;
  }

  return lines;
}

std::vector<log_line> make_log_lines(const std::vector<std::string> &lines) {
  std::vector<log_line> result;
  result.reserve(lines.size());
  for (const auto &line : lines) {
    result.push_back({result.size() + 1, line});
  }
  return result;
}

} // namespace latexerr
