/**
 * @file commands.hpp
 * @brief Declarations for latexerr command handlers
 */

#pragma once

#include "core/command.h" // Include for latexerr_context_t
#include "core/types.h"

/**
 * @brief Dispatch a command based on command line arguments
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success)
 */
extern "C" latexerr_int_t latexerr_dispatch_command(const latexerr_context_t *ctx);

/**
 * @brief Handle the 'check' command to report problems found in log files
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success, even when problems were
 * found)
 */
latexerr_int_t latexerr_cmd_check(const latexerr_context_t *ctx);

/**
 * @brief Handle the 'rules' command to list the rule catalogue
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success)
 */
latexerr_int_t latexerr_cmd_rules(const latexerr_context_t *ctx);

/**
 * @brief Handle the 'version' command
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success)
 */
latexerr_int_t latexerr_cmd_version(const latexerr_context_t *ctx);

/**
 * @brief Handle the 'help' command
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success)
 */
latexerr_int_t latexerr_cmd_help(const latexerr_context_t *ctx);
