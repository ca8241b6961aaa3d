/**
 * @file command_rules.cpp
 * @brief Implementation of the 'rules' command listing the rule catalogue
 */

#include "core/commands.hpp"
#include "core/diagnostic.hpp"
#include "core/rules.hpp"
#include "latexerr/log.hpp"

#include <fmt/core.h>

latexerr_int_t
latexerr_cmd_rules([[maybe_unused]] const latexerr_context_t *ctx) {
  for (const auto &r : latexerr::default_rules()) {
    latexerr::logger::print_plain(fmt::format("{:<28} {:<8} {}", r.name(),
                                              latexerr::level_name(r.level()),
                                              r.description()));
  }
  return 0;
}
