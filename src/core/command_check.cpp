/**
 * @file command_check.cpp
 * @brief Implementation of the 'check' command reporting problems in logs
 */

#include "core/command.h"
#include "core/commands.hpp"
#include "core/config.hpp"
#include "core/constants.h"
#include "core/error_format.hpp"
#include "core/rule_engine.hpp"
#include "latexerr/log.hpp"

#include <fmt/core.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace latexerr;

namespace fs = std::filesystem;

namespace {

/**
 * @brief Read a whole file into a string
 *
 * @return False if the file does not exist or cannot be read
 */
bool read_log_file(const fs::path &path, std::string &contents) {
  if (!fs::exists(path)) {
    logger::print_error("Log file not found: " + path.string());
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    logger::print_error("Failed to open log file: " + path.string());
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    logger::print_error("Failed to read log file: " + path.string());
    return false;
  }

  contents = buffer.str();
  return true;
}

/**
 * @brief Find and load the configuration for this run
 *
 * An explicit --config must exist. Otherwise latexerr.toml in the working
 * directory is used when present.
 */
bool load_run_config(const latexerr_context_t *ctx, check_config &config) {
  if (ctx->args.config) {
    fs::path config_path(ctx->args.config);
    if (!fs::exists(config_path)) {
      logger::print_error("Config file not found: " + config_path.string());
      return false;
    }
    return load_config(config_path.string(), config);
  }

  fs::path default_path = fs::path(ctx->working_dir) / LATEXERR_FILE;
  if (fs::exists(default_path)) {
    return load_config(default_path.string(), config);
  }
  return true;
}

/**
 * @brief Apply command line switches on top of the loaded configuration
 */
bool apply_cli_overrides(const latexerr_context_t *ctx, check_config &config) {
  if (ctx->args.rules) {
    config.has_enabled_rules = true;
    config.enabled_rules = split_rule_list(ctx->args.rules);
  }
  if (ctx->args.disabled) {
    for (const auto &name : split_rule_list(ctx->args.disabled)) {
      config.disabled_rules.push_back(name);
    }
  }
  if (ctx->args.verbosity) {
    std::string verbosity = ctx->args.verbosity;
    if (verbosity != "quiet" && verbosity != "normal" &&
        verbosity != "verbose") {
      logger::print_error("Invalid verbosity: " + verbosity);
      return false;
    }
    config.verbosity = verbosity;
  }
  if (ctx->args.flat) {
    config.output.group_by_file = false;
  }
  if (ctx->args.no_dedup) {
    config.output.deduplicate = false;
  }
  if (ctx->args.no_color) {
    config.output.color = false;
  }
  if (ctx->args.no_summary) {
    config.output.summary = false;
  }
  return true;
}

} // namespace

/**
 * @brief Handle the 'check' command
 *
 * @param ctx Context containing parsed arguments
 * @return latexerr_int_t Exit code (0 for success, even when problems were
 * found)
 */
latexerr_int_t latexerr_cmd_check(const latexerr_context_t *ctx) {
  check_config config;
  if (!load_run_config(ctx, config)) {
    return 1;
  }
  if (!apply_cli_overrides(ctx, config)) {
    return 1;
  }

  latexerr_set_verbosity(config.verbosity.c_str());
  logger::set_color(config.output.color);

  auto rules = resolve_rules(config);
  if (!rules) {
    return 1;
  }
  logger::print_verbose(fmt::format("{} rules active", rules->size()));

  if (ctx->args.arg_count == 0) {
    logger::print_error("No log files were passed");
    logger::print_status("Usage: latexerr check <file.log>...");
    return 1;
  }

  scan_options options;
  options.max_print_line = config.max_print_line;

  latexerr_int_t status = 0;
  int total_problems = 0;
  auto start_time = std::chrono::steady_clock::now();

  for (latexerr_int_t i = 0; i < ctx->args.arg_count; ++i) {
    fs::path log_path(ctx->args.args[i]);
    if (log_path.is_relative()) {
      log_path = fs::path(ctx->working_dir) / log_path;
    }

    std::string contents;
    if (!read_log_file(log_path, contents)) {
      // Keep going so the other logs still get reported
      status = 1;
      continue;
    }

    logger::checking(ctx->args.args[i]);
    if (contents.empty()) {
      logger::print_warning("Log file is empty: " + log_path.string());
    }
    std::vector<diagnostic> diagnostics = scan_text(contents, *rules, options);
    total_problems += static_cast<int>(diagnostics.size());

    fmt::print("{}", format_report(diagnostics, config.output));
  }

  auto end_time = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration<double>(end_time - start_time).count();
  logger::finished(fmt::format("{} problem{} in {:.2f}s", total_problems,
                               total_problems == 1 ? "" : "s", duration));

  return status;
}
