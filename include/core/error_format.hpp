/**
 * @file error_format.hpp
 * @brief Presentation of diagnostics: grouping, deduplication and summaries
 */

#pragma once

#include "core/diagnostic.hpp"

#include <string>
#include <utility>
#include <vector>

namespace latexerr {

/**
 * @brief Presentation switches
 */
struct format_options {
  bool color = true;         // ANSI colors through fmt text styles
  bool group_by_file = true; // "File: x" sections, otherwise Cargo-style list
  bool deduplicate = true;   // Collapse identical diagnostics
  bool summary = true;       // Append the error/warning counts
};

/**
 * @brief Structure for error/warning summary statistics
 */
struct error_summary {
  int total_errors = 0;
  int total_warnings = 0;
  std::vector<std::pair<std::string, int>> rule_counts; // (rule, count)
};

/**
 * @brief Describe where a diagnostic is, e.g. "line 12" or "lines 5--7"
 *
 * @return Empty string when the diagnostic carries no source position
 */
std::string format_location(const diagnostic &diag);

/**
 * @brief Format one diagnostic as an item of a file section
 *
 * Example: "Error on line 4: Unknown command \foo."
 */
std::string format_diagnostic_item(const diagnostic &diag, bool color = true);

/**
 * @brief Format a diagnostic to a string in Cargo style
 *
 * Example:
 *   error[undefined-control-sequence]: Unknown command \foo.
 *     --> main.tex:4
 */
std::string format_diagnostic_to_string(const diagnostic &diag,
                                        bool color = true);

/**
 * @brief Deduplicate identical diagnostics
 *
 * Diagnostics with the same rule, message, file and position collapse into
 * the first one, whose occurrence_count is incremented. Order of first
 * occurrences is kept.
 */
std::vector<diagnostic>
deduplicate_diagnostics(std::vector<diagnostic> diagnostics);

/**
 * @brief Order diagnostics by source position
 *
 * Diagnostics without a position come first and end-of-file ones last; ties
 * keep scan order.
 */
void sort_by_location(std::vector<diagnostic> &diagnostics);

/**
 * @brief Split diagnostics into per-file groups sorted by file name
 *
 * Unattributed diagnostics form a group with an empty name, placed first.
 */
std::vector<std::pair<std::string, std::vector<diagnostic>>>
group_by_file(const std::vector<diagnostic> &diagnostics);

/**
 * @brief Render the full report for one log
 */
std::string format_report(const std::vector<diagnostic> &diagnostics,
                          const format_options &options = format_options());

/**
 * @brief Calculate summary statistics from diagnostics
 */
error_summary
calculate_error_summary(const std::vector<diagnostic> &diagnostics);

/**
 * @brief Format error summary as a string
 *
 * Example output:
 *   2 errors, 1 warning
 *      1 undefined-control-sequence
 *      1 missing-package
 *      1 overfull-box
 *
 * An empty summary reads "No problems found".
 */
std::string format_error_summary(const error_summary &summary,
                                 bool color = true);

} // namespace latexerr
