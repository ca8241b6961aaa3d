/**
 * @file diagnostic.hpp
 * @brief Diagnostic record produced by the rule engine
 */

#pragma once

#include <cstddef>
#include <string>

#ifdef ERROR
#undef ERROR
#endif

namespace latexerr {

/**
 * @brief Severity of a diagnostic
 */
enum class diagnostic_level { ERROR, WARNING };

/**
 * @brief Structure representing one detected problem
 */
struct diagnostic {
  diagnostic_level level = diagnostic_level::ERROR;
  std::string code;          // Name of the rule that produced it
  std::string message;
  std::string file_path;     // Empty when no file was open
  int line_number = 0;       // Source line, 0 when the log gives none
  int end_line = 0;          // Last source line of a range, 0 if not a range
  bool at_end = false;       // Reported at the end of the file
  std::size_t log_line = 0;  // Log line where the match started
  int occurrence_count = 1;  // Set by deduplication
};

/**
 * @brief Human-readable name of a level ("Error", "Warning")
 */
inline const char *level_name(diagnostic_level level) {
  switch (level) {
  case diagnostic_level::ERROR:
    return "Error";
  case diagnostic_level::WARNING:
    return "Warning";
  }
  return "Error";
}

inline bool operator==(const diagnostic &lhs, const diagnostic &rhs) {
  return lhs.level == rhs.level && lhs.code == rhs.code &&
         lhs.message == rhs.message && lhs.file_path == rhs.file_path &&
         lhs.line_number == rhs.line_number && lhs.end_line == rhs.end_line &&
         lhs.at_end == rhs.at_end && lhs.log_line == rhs.log_line &&
         lhs.occurrence_count == rhs.occurrence_count;
}

inline bool operator!=(const diagnostic &lhs, const diagnostic &rhs) {
  return !(lhs == rhs);
}

} // namespace latexerr
