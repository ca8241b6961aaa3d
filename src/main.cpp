/**
 * @file main.cpp
 * @brief Main entry point for latexerr
 */

#include "core/command.h"
#include "core/commands.hpp"
#include "latexerr/log.hpp"

#include <exception>
#include <string>

/**
 * @brief Main function
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return int Exit code
 */
int main(int argc, char *argv[]) {
  latexerr_context_t ctx;
  if (!latexerr_parse_args(argc, argv, &ctx)) {
    latexerr_free_args(&ctx.args);
    latexerr::logger::print_status("Run 'latexerr help' for usage information");
    return 1;
  }

  latexerr_int_t result = 1;
  try {
    result = latexerr_dispatch_command(&ctx);
  } catch (const std::exception &ex) {
    latexerr::logger::print_error(std::string("Unexpected error: ") +
                                  ex.what());
    result = 1;
  }

  latexerr_free_args(&ctx.args);
  return result;
}
