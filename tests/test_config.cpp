/**
 * @file test_config.cpp
 * @brief Tests for latexerr.toml loading and active rule resolution
 */

#include "test_framework.h"
#include "core/config.hpp"
#include "latexerr/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace latexerr;

// Helper to create a temporary test directory
static fs::path create_temp_dir() {
  fs::path temp = fs::temp_directory_path() /
                  ("latexerr_test_" + std::to_string(std::rand()));
  fs::create_directories(temp);
  return temp;
}

// Helper to clean up test directory
static void cleanup_temp_dir(const fs::path &dir) {
  if (fs::exists(dir)) {
    fs::remove_all(dir);
  }
}

// Helper to write a test config file
static fs::path write_test_config(const fs::path &dir,
                                  const std::string &content) {
  fs::path path = dir / LATEXERR_FILE;
  std::ofstream file(path);
  file << content;
  file.close();
  return path;
}

TEST(Config, Defaults) {
  check_config config;

  test_assert(!config.has_enabled_rules);
  test_assert(config.output.group_by_file);
  test_assert(config.output.deduplicate);
  test_assert(config.output.color);
  test_assert(config.output.summary);
  test_assert_str(config.verbosity, "normal");
  test_assert(config.max_print_line == LATEXERR_MAX_PRINT_LINE);

  auto rules = resolve_rules(config);
  test_assert(rules.has_value());
  test_assert(rules->size() == default_rules().size());
  return 0;
}

TEST(Config, LoadValid) {
  fs::path temp = create_temp_dir();
  fs::path path = write_test_config(temp, R"(
# latexerr.toml - test file

[rules]
enabled = ["overfull-box", "undefined-control-sequence"]
disabled = ["overfull-box"]

[output]
group_by_file = false
deduplicate = false
color = false
summary = false
verbosity = "quiet"

[log]
max_print_line = 100
)");

  check_config config;
  bool loaded = load_config(path.string(), config);
  cleanup_temp_dir(temp);

  test_assert(loaded);
  test_assert(config.has_enabled_rules);
  test_assert(config.enabled_rules.size() == 2);
  test_assert_str(config.enabled_rules[0], "overfull-box");
  test_assert(config.disabled_rules.size() == 1);
  test_assert(!config.output.group_by_file);
  test_assert(!config.output.deduplicate);
  test_assert(!config.output.color);
  test_assert(!config.output.summary);
  test_assert_str(config.verbosity, "quiet");
  test_assert(config.max_print_line == 100);

  auto rules = resolve_rules(config);
  test_assert(rules.has_value());
  test_assert(rules->size() == 1);
  test_assert(rules->front().kind() == rule_kind::UNDEFINED_CONTROL_SEQUENCE);
  return 0;
}

TEST(Config, MissingKeysKeepDefaults) {
  fs::path temp = create_temp_dir();
  fs::path path = write_test_config(temp, "[output]\ncolor = false\n");

  check_config config;
  bool loaded = load_config(path.string(), config);
  cleanup_temp_dir(temp);

  test_assert(loaded);
  test_assert(!config.output.color);
  test_assert(config.output.group_by_file);
  test_assert(!config.has_enabled_rules);
  test_assert(config.max_print_line == LATEXERR_MAX_PRINT_LINE);
  return 0;
}

TEST(Config, LoadMissing) {
  fs::path temp = create_temp_dir();

  check_config config;
  bool loaded = load_config((temp / LATEXERR_FILE).string(), config);
  cleanup_temp_dir(temp);

  test_assert(!loaded);
  return 0;
}

TEST(Config, LoadMalformed) {
  fs::path temp = create_temp_dir();
  fs::path path = write_test_config(temp, "[rules\nenabled = [\n");

  check_config config;
  bool loaded = load_config(path.string(), config);
  cleanup_temp_dir(temp);

  test_assert(!loaded);
  return 0;
}

TEST(Config, InvalidVerbosity) {
  fs::path temp = create_temp_dir();
  fs::path path =
      write_test_config(temp, "[output]\nverbosity = \"chatty\"\n");

  check_config config;
  bool loaded = load_config(path.string(), config);
  cleanup_temp_dir(temp);

  test_assert(!loaded);
  return 0;
}

TEST(Config, NegativeMaxPrintLine) {
  fs::path temp = create_temp_dir();
  fs::path path = write_test_config(temp, "[log]\nmax_print_line = -1\n");

  check_config config;
  bool loaded = load_config(path.string(), config);
  cleanup_temp_dir(temp);

  test_assert(!loaded);
  return 0;
}

TEST(Config, SplitRuleList) {
  auto names = split_rule_list(" underfull-box, ,overfull-box ,");

  test_assert(names.size() == 2);
  test_assert_str(names[0], "underfull-box");
  test_assert_str(names[1], "overfull-box");
  test_assert(split_rule_list("").empty());
  return 0;
}

TEST(Config, ResolveKeepsEnabledOrder) {
  check_config config;
  config.has_enabled_rules = true;
  config.enabled_rules = {"missing-package", "undefined-control-sequence",
                          "missing-package"};

  auto rules = resolve_rules(config);

  test_assert(rules.has_value());
  test_assert(rules->size() == 2);
  test_assert(rules->at(0).kind() == rule_kind::MISSING_PACKAGE);
  test_assert(rules->at(1).kind() == rule_kind::UNDEFINED_CONTROL_SEQUENCE);
  return 0;
}

TEST(Config, ResolveUnknownRule) {
  check_config config;
  config.disabled_rules = {"no-such-rule"};

  test_assert(!resolve_rules(config).has_value());

  config.disabled_rules.clear();
  config.has_enabled_rules = true;
  config.enabled_rules = {"undefined-control-sequence", "bogus"};
  test_assert(!resolve_rules(config).has_value());
  return 0;
}

TEST(Config, ResolveEmptySetIsValid) {
  check_config config;
  config.has_enabled_rules = true;

  auto rules = resolve_rules(config);
  test_assert(rules.has_value());
  test_assert(rules->empty());

  check_config all_disabled;
  for (const auto &r : default_rules()) {
    all_disabled.disabled_rules.push_back(r.name());
  }
  rules = resolve_rules(all_disabled);
  test_assert(rules.has_value());
  test_assert(rules->empty());
  return 0;
}
