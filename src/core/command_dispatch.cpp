/**
 * @file command_dispatch.cpp
 * @brief Routing of a parsed command line to its handler
 */

#include "core/command.h"
#include "core/commands.hpp"
#include "latexerr/log.hpp"

#include <string.h>

#include <string>

using namespace latexerr;

/**
 * @brief Dispatch command based on command line arguments
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success)
 */
extern "C" latexerr_int_t
latexerr_dispatch_command(const latexerr_context_t *ctx) {
  // Check if command is null
  if (!ctx->args.command) {
    // No command specified, show help
    return latexerr_cmd_help(ctx);
  }

  // Dispatch command based on name
  if (strcmp(ctx->args.command, "check") == 0) {
    return latexerr_cmd_check(ctx);
  } else if (strcmp(ctx->args.command, "rules") == 0) {
    return latexerr_cmd_rules(ctx);
  } else if (strcmp(ctx->args.command, "version") == 0) {
    return latexerr_cmd_version(ctx);
  } else if (strcmp(ctx->args.command, "help") == 0) {
    return latexerr_cmd_help(ctx);
  } else {
    logger::print_error("Unknown command: " + std::string(ctx->args.command));
    logger::print_status("Run 'latexerr help' for usage information");
    return 1;
  }
}
