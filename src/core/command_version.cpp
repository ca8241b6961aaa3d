/**
 * @file command_version.cpp
 * @brief Implementation of the 'version' command to display latexerr version
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "core/rules.hpp"
#include "latexerr/log.hpp"

#include <string>

/**
 * @brief Display latexerr version information
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success)
 */
latexerr_int_t
latexerr_cmd_version([[maybe_unused]] const latexerr_context_t *ctx) {
  latexerr::logger::print_action(
      "Version", "latexerr version " + std::string(LATEXERR_VERSION));
  latexerr::logger::print_action(
      "Info", "TeX log checker with " +
                  std::to_string(latexerr::all_rule_kinds().size()) +
                  " rules");

  return 0;
}
