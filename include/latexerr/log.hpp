/**
 * @file log.hpp
 * @brief Cargo-style logging utilities for latexerr
 *
 * Output format matches Rust's Cargo:
 *   - 12-character right-aligned status word (colored)
 *   - Message follows in default color
 *   - No emojis, no brackets
 */

#ifndef LATEXERR_LOG_HPP
#define LATEXERR_LOG_HPP

#include "core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @enum latexerr_log_verbosity_t
 * @brief C-compatible enum for logging verbosity levels
 */
typedef enum {
  LATEXERR_VERBOSITY_QUIET,  /**< Minimal output, only errors */
  LATEXERR_VERBOSITY_NORMAL, /**< Standard output level */
  LATEXERR_VERBOSITY_VERBOSE /**< Detailed output for debugging */
} latexerr_log_verbosity_t;

// C wrapper functions
void latexerr_set_verbosity_impl(latexerr_log_verbosity_t level);

#ifdef __cplusplus
} // extern "C"

#include <fmt/color.h>
#include <fmt/core.h>
#include <string>

namespace latexerr {

/**
 * @enum log_verbosity
 * @brief C++ enum class for logging verbosity levels
 */
enum class log_verbosity {
  VERBOSITY_QUIET,  /**< Minimal output, only errors */
  VERBOSITY_NORMAL, /**< Standard output level */
  VERBOSITY_VERBOSE /**< Detailed output for debugging */
};

/**
 * @class logger
 * @brief Static class providing Cargo-style logging functionality
 *
 * All output follows Cargo's format:
 *   {status:>12} {message}
 *
 * Where status is a colored action word like "Checking", "Finished", etc.
 */
class logger {
public:
  // ============================================================
  // Configuration
  // ============================================================

  /**
   * @brief Sets the global verbosity level for logging
   * @param level The verbosity level to set
   */
  static void set_verbosity(log_verbosity level);

  /**
   * @brief Enable or disable ANSI colors on status words
   */
  static void set_color(bool enabled);

  // ============================================================
  // Cargo-style status messages (right-aligned status word)
  // ============================================================

  /**
   * @brief Print a status message with custom action word
   *
   * Format: "{action:>12} {message}"
   * Color: Green for the action word
   *
   * @param action The action word (e.g., "Checking", "Reading")
   * @param message The message to print
   */
  static void print_action(const std::string &action,
                           const std::string &message);

  /**
   * @brief Print a cyan status message (info/progress)
   */
  static void print_status(const std::string &message);

  /**
   * @brief Print a yellow warning message
   */
  static void print_warning(const std::string &message);

  /**
   * @brief Print a red error message
   */
  static void print_error(const std::string &message);

  /**
   * @brief Print a gray verbose/debug message
   */
  static void print_verbose(const std::string &message);

  // ============================================================
  // Specific action helpers (Cargo-style)
  // ============================================================

  /**
   * @brief Print "Checking {target}"
   */
  static void checking(const std::string &target);

  /**
   * @brief Print "Finished {summary}"
   */
  static void finished(const std::string &summary);

  // ============================================================
  // Plain output
  // ============================================================

  /**
   * @brief Print a plain message (no status prefix)
   */
  static void print_plain(const std::string &message);

private:
  static log_verbosity s_verbosity;
  static bool s_color;

  // Status width for right-alignment (Cargo uses 12)
  static constexpr int STATUS_WIDTH = 12;

  /**
   * @brief Internal helper to print formatted status line
   */
  static void print_status_line(const std::string &status,
                                const std::string &message,
                                fmt::color status_color, bool is_bold = true,
                                FILE *stream = stdout);
};

} // namespace latexerr
#endif

#endif // LATEXERR_LOG_HPP
