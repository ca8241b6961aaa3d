/**
 * @file log.cpp
 * @brief Cargo-style logging implementation
 *
 * Output format:
 *   {status:>12} {message}
 *
 * Examples:
 *       Checking thesis.log
 *       Finished 2 errors, 5 warnings
 *        warning: Log file is empty: draft.log
 *          error: Log file not found: missing.log
 */


#include "latexerr/log.hpp"
#include "core/types.h"

#ifdef __cplusplus
namespace latexerr {

log_verbosity logger::s_verbosity = log_verbosity::VERBOSITY_NORMAL;
bool logger::s_color = true;

void logger::set_verbosity(log_verbosity level) { s_verbosity = level; }

void logger::set_color(bool enabled) { s_color = enabled; }


// Core formatting helper


void logger::print_status_line(const std::string &status,
                               const std::string &message,
                               fmt::color status_color, bool is_bold,
                               FILE *stream) {
  // Right-align status word to STATUS_WIDTH characters
  fmt::text_style style;
  if (s_color) {
    style = fg(status_color);
    if (is_bold) {
      style |= fmt::emphasis::bold;
    }
  }
  fmt::print(stream, style, "{:>{}}", status, STATUS_WIDTH);
  fmt::print(stream, " {}\n", message);
}


// Main logging functions


void logger::print_action(const std::string &action,
                          const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line(action, message, fmt::color::green);
}

void logger::print_status(const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("", message, fmt::color::cyan);
}

void logger::print_warning(const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("warning", message, fmt::color::yellow, true, stderr);
}

void logger::print_error(const std::string &message) {
  // Errors always show
  print_status_line("error", message, fmt::color::red, true, stderr);
}

void logger::print_verbose(const std::string &message) {
  if (s_verbosity != log_verbosity::VERBOSITY_VERBOSE)
    return;

  // Gray, non-bold for verbose output
  print_status_line("", message, fmt::color::gray, false);
}


// Cargo-style action helpers


void logger::checking(const std::string &target) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("Checking", target, fmt::color::green);
}

void logger::finished(const std::string &summary) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("Finished", summary, fmt::color::green);
}


// Plain output


void logger::print_plain(const std::string &message) {
  fmt::print("{}\n", message);
}

} // namespace latexerr


// C wrapper implementations

extern "C" {

void latexerr_set_verbosity_impl(latexerr_log_verbosity_t level) {
  latexerr::log_verbosity cpp_level;
  switch (level) {
  case LATEXERR_VERBOSITY_QUIET:
    cpp_level = latexerr::log_verbosity::VERBOSITY_QUIET;
    break;
  case LATEXERR_VERBOSITY_VERBOSE:
    cpp_level = latexerr::log_verbosity::VERBOSITY_VERBOSE;
    break;
  default:
    cpp_level = latexerr::log_verbosity::VERBOSITY_NORMAL;
    break;
  }
  latexerr::logger::set_verbosity(cpp_level);
}

} // extern "C"
#endif // __cplusplus
