/**
 * @file file_context.hpp
 * @brief Tracking of the compiler's open-file stack while scanning a log
 *
 * TeX announces every file it opens with "(" followed by the file name and
 * closes it with a matching ")". Other parenthesised text, such as
 * "(badness 10000)", is balanced on the same stack as an anonymous entry so
 * its ")" never closes a real file.
 */

#pragma once

#include "core/constants.h"
#include "core/log_line.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace latexerr {

/**
 * @brief Maintains the stack of currently open source files
 *
 * Characters are consumed as one stream across physical lines, so file names
 * hard-wrapped at max_print_line and runs of ")" that straddle a line break
 * are handled the same as if they were on one line.
 */
class file_context_tracker {
public:
  /**
   * @brief Construct a tracker
   * @param max_print_line Column at which the compiler wraps its output
   *        (0 disables wrap detection)
   */
  explicit file_context_tracker(
      std::size_t max_print_line = LATEXERR_MAX_PRINT_LINE);

  /**
   * @brief Feed one physical log line through the tracker
   */
  void observe(const log_line &line);

  /**
   * @brief Complete a file name that is still being read
   *
   * Called when the next lines are not going to be observed, so a name that
   * looked wrapped is taken as it stands.
   */
  void flush();

  /**
   * @brief Innermost open file, if any
   */
  std::optional<std::string> current_file() const;

  /**
   * @brief Number of open entries, named or anonymous
   */
  std::size_t depth() const { return m_stack.size(); }

  /**
   * @brief Names of the open files, outermost first
   */
  std::vector<std::string> open_files() const;

  /**
   * @brief Forget all state
   */
  void reset();

  /**
   * @brief Whether a token read after "(" looks like a file name
   *
   * A token is a file name when it contains a path separator or ends in an
   * extension of at least two characters starting with a letter.
   */
  static bool is_filename_token(const std::string &token);

  /**
   * @brief Strip the "./" prefix TeX prints for files in the working
   * directory
   */
  static std::string normalize_filename(const std::string &token);

private:
  void finish_token();
  void close_entry();

  // Empty name marks an anonymous parenthesis group
  std::vector<std::string> m_stack;
  std::string m_pending;
  bool m_reading_token = false;
  bool m_quoted = false;
  std::size_t m_max_print_line;
};

} // namespace latexerr
