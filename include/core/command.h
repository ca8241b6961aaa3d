/**
 * @file command.h
 * @brief Command line argument parsing and command dispatching for latexerr
 */

#ifndef LATEXERR_COMMAND_H
#define LATEXERR_COMMAND_H

#include <stdbool.h>

#include "core/constants.h"
#include "core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Command line argument structure
 * @details This structure holds the command line arguments parsed from the
 * input.
 */
typedef struct {
  latexerr_string_t command;   // Primary command (check, rules, version, help)
  latexerr_string_t config;    // Optional path to a latexerr.toml
  latexerr_string_t rules;     // Optional comma separated active rule list
  latexerr_string_t disabled;  // Optional comma separated rules to disable
  latexerr_string_t verbosity; // Verbosity level (quiet, normal, verbose)
  latexerr_string_t *args;     // Positional arguments for the command
  latexerr_int_t arg_count;    // Number of positional arguments
  bool flat;                   // Cargo-style list instead of file sections
  bool no_dedup;               // Keep repeated diagnostics
  bool no_color;               // Plain output
  bool no_summary;             // Omit the error/warning counts
} latexerr_command_args_t;

/**
 * @brief Context structure for command execution
 * @details This structure holds the context for executing a command, including
 * the command arguments and working directory.
 */
typedef struct {
  latexerr_command_args_t args;
  latexerr_char_t working_dir[256];
} latexerr_context_t;

/**
 * @brief Parse command line arguments into a context
 * @details A first argument that is a log file or an option implies the
 * 'check' command.
 * @return false on an unknown option or a missing option value
 */
bool latexerr_parse_args(latexerr_int_t argc, latexerr_string_t argv[],
                         latexerr_context_t *ctx);

/**
 * @brief Free allocated resources in command arguments
 */
void latexerr_free_args(latexerr_command_args_t *args);

/**
 * @brief Set the verbosity level for logging
 * @details This function sets the verbosity level for logging output. It can be
 * set to quiet, normal, or verbose.
 */
void latexerr_set_verbosity(latexerr_cstring_t level);

#ifdef __cplusplus
}
#endif

#endif
