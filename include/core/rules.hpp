/**
 * @file rules.hpp
 * @brief Detection rules that recognise one category of TeX complaint each
 *
 * A rule looks at the log starting from a given line and either consumes a
 * contiguous span of lines (its multi-line signature) or declines. Rules are
 * stateless values, so the same rule list can drive any number of scans.
 */

#pragma once

#include "core/constants.h"
#include "core/diagnostic.hpp"
#include "core/log_line.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace latexerr {

/**
 * @brief Closed set of rule kinds
 */
enum class rule_kind {
  UNDEFINED_CONTROL_SEQUENCE,
  BRACE_MISMATCH,
  NOT_IN_MATH_MODE,
  RUNAWAY_ARGUMENT,
  UNDERFULL_BOX,
  OVERFULL_BOX,
  MISSING_PACKAGE,
  INVALID_OPTION,
  ALIGNMENT_TAB_MISMATCH,
  UNDEFINED_ENVIRONMENT,
  UNDEFINED_REFERENCE
};

/**
 * @brief Lines consumed by a successful match and what was captured
 */
struct match_span {
  std::size_t first_line = 0; // Log line number of the first consumed line
  std::size_t line_count = 0; // Number of consumed lines, at least 1
  std::vector<std::string> captures;
  int source_line = 0; // Line in the source document, 0 if unknown
  int end_line = 0;    // End of a source line range, 0 if not a range
  bool at_end = false; // Problem surfaced at the end of the file
  bool silent = false; // Consumed without producing a diagnostic
};

/**
 * @brief A detection rule
 *
 * Severity is fixed per kind: rules whose log signature starts with "!"
 * (and the runaway argument report that precedes one) are errors, box and
 * reference complaints are warnings.
 */
class rule {
public:
  explicit rule(rule_kind kind) : m_kind(kind) {}

  rule_kind kind() const { return m_kind; }

  /**
   * @brief Stable kebab-case name used in configuration and as the
   * diagnostic code
   */
  const char *name() const;

  /**
   * @brief One-line description for the `rules` command
   */
  const char *description() const;

  diagnostic_level level() const;

  /**
   * @brief Try to recognise this rule's signature starting at a line
   *
   * @param lines The whole log
   * @param index Index into lines of the candidate first line
   * @param max_print_line Column at which the compiler wraps its output
   * @return The consumed span, or nullopt when the signature does not start
   *         here or is incomplete
   */
  std::optional<match_span>
  try_match(const std::vector<log_line> &lines, std::size_t index,
            std::size_t max_print_line = LATEXERR_MAX_PRINT_LINE) const;

  /**
   * @brief Turn a match into a diagnostic
   *
   * @param span A span returned by try_match of this rule
   * @param file Innermost open file when the match started
   */
  diagnostic render(const match_span &span,
                    const std::optional<std::string> &file) const;

  bool operator==(const rule &other) const { return m_kind == other.m_kind; }
  bool operator!=(const rule &other) const { return m_kind != other.m_kind; }

private:
  rule_kind m_kind;
};

/**
 * @brief Every rule kind in default registration order
 */
std::vector<rule_kind> all_rule_kinds();

/**
 * @brief The full rule catalogue in default registration order
 */
std::vector<rule> default_rules();

/**
 * @brief Look up a rule by its name
 * @return The rule, or nullopt for an unknown name
 */
std::optional<rule> rule_from_name(const std::string &name);

} // namespace latexerr
