/**
 * @file config.hpp
 * @brief latexerr.toml settings and resolution of the active rule list
 */

#pragma once

#include "core/constants.h"
#include "core/error_format.hpp"
#include "core/rules.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace latexerr {

/**
 * @brief Settings of a `check` run
 *
 * Defaults apply when no latexerr.toml is present; command-line options are
 * applied on top of whatever was loaded.
 */
struct check_config {
  bool has_enabled_rules = false;         // [rules] enabled was given
  std::vector<std::string> enabled_rules; // Ordered, first registered wins
  std::vector<std::string> disabled_rules;
  format_options output;
  std::string verbosity = "normal";
  std::size_t max_print_line = LATEXERR_MAX_PRINT_LINE;
};

/**
 * @brief Load settings from a TOML file into config
 *
 * Keys that are absent leave the current values untouched.
 *
 * @return False if the file cannot be parsed or holds invalid values
 */
bool load_config(const std::string &path, check_config &config);

/**
 * @brief Split a comma separated list of rule names
 */
std::vector<std::string> split_rule_list(const std::string &list);

/**
 * @brief Build the ordered list of active rules
 *
 * Starts from the enabled list (or the whole catalogue) and removes the
 * disabled ones. An empty result is valid.
 *
 * @return The rules, or nullopt if any name is unknown
 */
std::optional<std::vector<rule>> resolve_rules(const check_config &config);

} // namespace latexerr
