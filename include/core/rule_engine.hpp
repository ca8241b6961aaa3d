/**
 * @file rule_engine.hpp
 * @brief Cursor-driven scan of a log against an ordered rule list
 */

#pragma once

#include "core/constants.h"
#include "core/diagnostic.hpp"
#include "core/file_context.hpp"
#include "core/log_line.hpp"
#include "core/rules.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace latexerr {

/**
 * @brief Knobs of a single scan
 */
struct scan_options {
  std::size_t max_print_line = LATEXERR_MAX_PRINT_LINE;
};

/**
 * @brief Lazily yields the diagnostics of one log
 *
 * At every cursor position the rules are tried in registration order and
 * the first one that matches wins: its lines are skipped and one diagnostic
 * is produced, attributed to the innermost file open at that point. A silent
 * match skips its lines without producing anything. When no rule matches,
 * the line is fed to the file-context tracker instead.
 *
 * A scanner makes exactly one pass; construct a new one to scan again.
 */
class log_scanner {
public:
  log_scanner(std::vector<log_line> lines, std::vector<rule> rules,
              scan_options options = scan_options());

  /**
   * @brief Advance to the next diagnostic
   * @return The diagnostic, or nullopt once the log is exhausted
   */
  std::optional<diagnostic> next();

  /**
   * @brief Whether the cursor has passed the last line
   */
  bool done() const { return m_cursor >= m_lines.size(); }

  const file_context_tracker &tracker() const { return m_tracker; }

private:
  std::vector<log_line> m_lines;
  std::vector<rule> m_rules;
  scan_options m_options;
  file_context_tracker m_tracker;
  std::size_t m_cursor = 0;
};

/**
 * @brief Scan a whole log and collect every diagnostic in scan order
 */
std::vector<diagnostic> scan(const std::vector<log_line> &lines,
                             const std::vector<rule> &rules,
                             const scan_options &options = scan_options());

/**
 * @brief Split a log buffer into lines and scan it
 */
std::vector<diagnostic> scan_text(const std::string &text,
                                  const std::vector<rule> &rules,
                                  const scan_options &options = scan_options());

} // namespace latexerr
