/**
 * @file rule_engine.cpp
 * @brief Implementation of the log scanner
 */

#include "core/rule_engine.hpp"
#include "latexerr/log.hpp"

#include <fmt/core.h>

#include <utility>

namespace latexerr {

log_scanner::log_scanner(std::vector<log_line> lines, std::vector<rule> rules,
                         scan_options options)
    : m_lines(std::move(lines)), m_rules(std::move(rules)), m_options(options),
      m_tracker(options.max_print_line) {}

std::optional<diagnostic> log_scanner::next() {
  while (m_cursor < m_lines.size()) {
    bool skipped = false;
    for (const auto &candidate : m_rules) {
      auto span =
          candidate.try_match(m_lines, m_cursor, m_options.max_print_line);
      if (!span) {
        continue;
      }

      // Matched lines are never observed, so settle a half-read file name
      m_tracker.flush();
      m_cursor += span->line_count;

      if (span->silent) {
        logger::print_verbose(fmt::format("{} skipped log lines {}-{}",
                                          candidate.name(), span->first_line,
                                          span->first_line + span->line_count -
                                              1));
        skipped = true;
        break;
      }

      diagnostic diag = candidate.render(*span, m_tracker.current_file());
      logger::print_verbose(fmt::format("{} matched log lines {}-{}",
                                        candidate.name(), span->first_line,
                                        span->first_line + span->line_count -
                                            1));
      return diag;
    }
    if (skipped) {
      continue;
    }

    m_tracker.observe(m_lines[m_cursor]);
    ++m_cursor;
  }

  m_tracker.flush();
  return std::nullopt;
}

std::vector<diagnostic> scan(const std::vector<log_line> &lines,
                             const std::vector<rule> &rules,
                             const scan_options &options) {
  std::vector<diagnostic> diagnostics;
  log_scanner scanner(lines, rules, options);
  while (auto diag = scanner.next()) {
    diagnostics.push_back(std::move(*diag));
  }
  return diagnostics;
}

std::vector<diagnostic> scan_text(const std::string &text,
                                  const std::vector<rule> &rules,
                                  const scan_options &options) {
  return scan(split_log_lines(text), rules, options);
}

} // namespace latexerr
