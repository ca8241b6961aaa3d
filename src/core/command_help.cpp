/**
 * @file command_help.cpp
 * @brief Implementation of the 'help' command to provide usage information
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "latexerr/log.hpp"

#include <string>

using latexerr::logger;

/**
 * @brief Handle the 'help' command
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success)
 */
latexerr_int_t latexerr_cmd_help(const latexerr_context_t *ctx) {
  std::string specific_command;

  // Check if a specific command was requested
  if (ctx->args.args && ctx->args.arg_count > 0 && ctx->args.args[0] &&
      ctx->args.args[0][0] != '-') {
    specific_command = ctx->args.args[0];
  }

  if (specific_command.empty()) {
    logger::print_plain("latexerr - readable problem reports from TeX logs");
    logger::print_plain("");
    logger::print_plain("Available commands:");
    logger::print_plain("  check     Report problems found in log files");
    logger::print_plain("  rules     List the detection rules");
    logger::print_plain("  version   Show version information");
    logger::print_plain("  help      Show help for a specific command");
    logger::print_plain("");
    logger::print_plain("Usage: latexerr <command> [options]");
    logger::print_plain("       latexerr <file.log>... [options]");
    logger::print_plain("");
    logger::print_plain("For more information on a specific command, run "
                        "'latexerr help <command>'");
  } else if (specific_command == "check") {
    logger::print_plain("latexerr check - Report problems found in log files");
    logger::print_plain("");
    logger::print_plain("Usage: latexerr check <file.log>... [options]");
    logger::print_plain("");
    logger::print_plain("Options:");
    logger::print_plain(
        "  --config <path>      Read settings from this file instead of "
        "./" LATEXERR_FILE);
    logger::print_plain(
        "  --rules <a,b,...>    Only run these rules, in this order");
    logger::print_plain("  --disable <a,b,...>  Skip these rules");
    logger::print_plain(
        "  --flat               One Cargo-style entry per problem instead of "
        "file sections");
    logger::print_plain("  --no-dedup           Report repeated problems "
                        "separately");
    logger::print_plain("  --no-color           Disable colored output");
    logger::print_plain("  --no-summary         Omit the error/warning counts");
    logger::print_plain("  -q, --quiet          Only print the report");
    logger::print_plain("  -v, --verbose        Show which rule matched which "
                        "log lines");
    logger::print_plain("");
    logger::print_plain("Configuration (" LATEXERR_FILE "):");
    logger::print_plain("  [rules]   enabled = [...], disabled = [...]");
    logger::print_plain("  [output]  group_by_file, deduplicate, color, "
                        "summary, verbosity");
    logger::print_plain("  [log]     max_print_line");
    logger::print_plain("");
    logger::print_plain("Examples:");
    logger::print_plain("  latexerr check thesis.log");
    logger::print_plain("  latexerr thesis.log --disable underfull-box");
  } else if (specific_command == "rules") {
    logger::print_plain("latexerr rules - List the detection rules");
    logger::print_plain("");
    logger::print_plain("Usage: latexerr rules");
    logger::print_plain("");
    logger::print_plain("Rules are listed in the order they are tried. The "
                        "names are the ones accepted");
    logger::print_plain("by --rules, --disable and the [rules] section.");
  } else if (specific_command == "version") {
    logger::print_plain("latexerr version - Show version information");
    logger::print_plain("");
    logger::print_plain("Usage: latexerr version");
  } else if (specific_command == "help") {
    logger::print_plain("latexerr help - Show help for a specific command");
    logger::print_plain("");
    logger::print_plain("Usage: latexerr help [command]");
  } else {
    logger::print_error("Unknown command: " + specific_command);
    logger::print_plain("Run 'latexerr help' for a list of available commands");
    return 1;
  }

  return 0;
}
