/**
 * @file config.cpp
 * @brief Loading latexerr.toml and resolving rule names
 */

#include "core/config.hpp"
#include "core/toml_reader.hpp"
#include "latexerr/log.hpp"

#include <algorithm>
#include <sstream>

namespace latexerr {

bool load_config(const std::string &path, check_config &config) {
  toml_reader reader;
  if (!reader.load(path)) {
    return false;
  }

  if (reader.has_key("rules.enabled")) {
    config.has_enabled_rules = true;
    config.enabled_rules = reader.get_string_array("rules.enabled");
  }
  if (reader.has_key("rules.disabled")) {
    config.disabled_rules = reader.get_string_array("rules.disabled");
  }

  config.output.group_by_file =
      reader.get_bool("output.group_by_file", config.output.group_by_file);
  config.output.deduplicate =
      reader.get_bool("output.deduplicate", config.output.deduplicate);
  config.output.color = reader.get_bool("output.color", config.output.color);
  config.output.summary =
      reader.get_bool("output.summary", config.output.summary);

  std::string verbosity =
      reader.get_string("output.verbosity", config.verbosity);
  if (verbosity != "quiet" && verbosity != "normal" &&
      verbosity != "verbose") {
    logger::print_error("Invalid verbosity '" + verbosity + "' in " + path +
                        " (expected quiet, normal or verbose)");
    return false;
  }
  config.verbosity = verbosity;

  int64_t max_print_line = reader.get_int(
      "log.max_print_line", static_cast<int64_t>(config.max_print_line));
  if (max_print_line < 0) {
    logger::print_error("log.max_print_line must not be negative in " + path);
    return false;
  }
  config.max_print_line = static_cast<std::size_t>(max_print_line);

  logger::print_verbose("Loaded configuration from " + path);
  return true;
}

std::vector<std::string> split_rule_list(const std::string &list) {
  std::vector<std::string> names;
  std::stringstream ss(list);
  std::string name;

  while (std::getline(ss, name, ',')) {
    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t") + 1);
    if (!name.empty()) {
      names.push_back(name);
    }
  }
  return names;
}

std::optional<std::vector<rule>> resolve_rules(const check_config &config) {
  std::vector<rule> rules;
  bool valid = true;

  if (config.has_enabled_rules) {
    for (const auto &name : config.enabled_rules) {
      auto found = rule_from_name(name);
      if (!found) {
        logger::print_error("Unknown rule: " + name);
        valid = false;
        continue;
      }
      if (std::find(rules.begin(), rules.end(), *found) == rules.end()) {
        rules.push_back(*found);
      }
    }
  } else {
    rules = default_rules();
  }

  for (const auto &name : config.disabled_rules) {
    auto found = rule_from_name(name);
    if (!found) {
      logger::print_error("Unknown rule: " + name);
      valid = false;
      continue;
    }
    rules.erase(std::remove(rules.begin(), rules.end(), *found), rules.end());
  }

  if (!valid) {
    logger::print_status("Run 'latexerr rules' to list the available rules");
    return std::nullopt;
  }
  return rules;
}

} // namespace latexerr
