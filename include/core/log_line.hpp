/**
 * @file log_line.hpp
 * @brief Line model for compiler log text
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace latexerr {

/**
 * @brief One physical line of a compiler log
 */
struct log_line {
  std::size_t number = 0; // 1-indexed position in the log
  std::string text;       // Raw content without the line terminator
};

/**
 * @brief Split a log buffer into numbered lines
 *
 * Accepts "\n" and "\r\n" terminators. A terminator at the very end of the
 * buffer does not produce a trailing empty line.
 *
 * @param text The whole log as read from disk
 * @return Lines numbered from 1
 */
std::vector<log_line> split_log_lines(const std::string &text);

/**
 * @brief Build numbered lines from already separated strings
 */
std::vector<log_line> make_log_lines(const std::vector<std::string> &lines);

} // namespace latexerr
