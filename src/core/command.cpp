/**
 * @file command.cpp
 * @brief Implementation of command line parsing utilities
 */

#include <stdlib.h>
#include <string.h>

#include <filesystem>
#include <string>
#include <vector>

#include "latexerr/log.hpp"
#include "core/command.h"

using namespace latexerr;

namespace {

bool is_log_file(const std::string &arg) {
  const std::string extension = LATEXERR_LOG_EXTENSION;
  return arg.size() > extension.size() &&
         arg.compare(arg.size() - extension.size(), extension.size(),
                     extension) == 0;
}

// Accepts both "--name value" and "--name=value"
bool take_value(const std::vector<std::string> &args, size_t &i,
                const std::string &name, latexerr_string_t *out) {
  const std::string &arg = args[i];
  if (arg == name) {
    if (i + 1 >= args.size()) {
      logger::print_error("Missing value for " + name);
      return false;
    }
    free(*out);
    *out = strdup(args[++i].c_str());
    return true;
  }

  free(*out);
  *out = strdup(arg.substr(name.size() + 1).c_str());
  return true;
}

bool has_value_form(const std::string &arg, const std::string &name) {
  return arg == name || arg.rfind(name + "=", 0) == 0;
}

} // namespace

// Function to parse command line arguments
bool latexerr_parse_args(latexerr_int_t argc, latexerr_string_t argv[],
                         latexerr_context_t *ctx) {
  memset(ctx, 0, sizeof(latexerr_context_t));

  // Get current working directory
  std::string cwd = std::filesystem::current_path().string();
  strncpy(ctx->working_dir, cwd.c_str(), sizeof(ctx->working_dir) - 1);

  std::vector<std::string> args;
  for (latexerr_int_t i = 1; i < argc; i++) {
    args.emplace_back(argv[i]);
  }

  // No arguments at all shows help
  if (args.empty()) {
    return true;
  }

  // "latexerr thesis.log" and "latexerr --flat thesis.log" imply check
  size_t first = 0;
  if (is_log_file(args[0]) || args[0][0] == '-') {
    if (args[0] == "-h" || args[0] == "--help") {
      ctx->args.command = strdup("help");
      first = 1;
    } else if (args[0] == "-V" || args[0] == "--version") {
      ctx->args.command = strdup("version");
      first = 1;
    } else {
      ctx->args.command = strdup("check");
    }
  } else {
    ctx->args.command = strdup(args[0].c_str());
    first = 1;
  }

  std::vector<std::string> positional;
  for (size_t i = first; i < args.size(); i++) {
    const std::string &arg = args[i];

    if (arg == "--") {
      // Kept for compatibility with "latexerr -- file.log"
      continue;
    } else if (has_value_form(arg, "--config")) {
      if (!take_value(args, i, "--config", &ctx->args.config))
        return false;
    } else if (has_value_form(arg, "--rules")) {
      if (!take_value(args, i, "--rules", &ctx->args.rules))
        return false;
    } else if (has_value_form(arg, "--disable")) {
      if (!take_value(args, i, "--disable", &ctx->args.disabled))
        return false;
    } else if (has_value_form(arg, "--verbosity")) {
      if (!take_value(args, i, "--verbosity", &ctx->args.verbosity))
        return false;
    } else if (arg == "-v" || arg == "--verbose") {
      free(ctx->args.verbosity);
      ctx->args.verbosity = strdup("verbose");
    } else if (arg == "-q" || arg == "--quiet") {
      free(ctx->args.verbosity);
      ctx->args.verbosity = strdup("quiet");
    } else if (arg == "--flat") {
      ctx->args.flat = true;
    } else if (arg == "--no-dedup") {
      ctx->args.no_dedup = true;
    } else if (arg == "--no-color") {
      ctx->args.no_color = true;
    } else if (arg == "--no-summary") {
      ctx->args.no_summary = true;
    } else if (!arg.empty() && arg[0] == '-') {
      logger::print_error("Unknown option: " + arg);
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  // Store positional arguments, null-terminated
  ctx->args.arg_count = static_cast<latexerr_int_t>(positional.size());
  ctx->args.args = (latexerr_string_t *)malloc((positional.size() + 1) *
                                               sizeof(latexerr_string_t));
  if (!ctx->args.args) {
    logger::print_error("Out of memory while parsing arguments");
    return false;
  }
  for (size_t i = 0; i < positional.size(); i++) {
    ctx->args.args[i] = strdup(positional[i].c_str());
  }
  ctx->args.args[positional.size()] = NULL;

  return true;
}

// Function to free allocated resources
void latexerr_free_args(latexerr_command_args_t *args) {
  if (args->args) {
    for (latexerr_int_t i = 0; i < args->arg_count; i++) {
      free(args->args[i]);
    }
    free(args->args);
    args->args = NULL;
  }
  args->arg_count = 0;

  free(args->command);
  free(args->config);
  free(args->rules);
  free(args->disabled);
  free(args->verbosity);
  args->command = NULL;
  args->config = NULL;
  args->rules = NULL;
  args->disabled = NULL;
  args->verbosity = NULL;
}

// Verbosity handling
void latexerr_set_verbosity(latexerr_cstring_t level) {
  if (!level)
    return;

  if (strcmp(level, "quiet") == 0) {
    latexerr_set_verbosity_impl(LATEXERR_VERBOSITY_QUIET);
  } else if (strcmp(level, "verbose") == 0) {
    latexerr_set_verbosity_impl(LATEXERR_VERBOSITY_VERBOSE);
  } else {
    latexerr_set_verbosity_impl(LATEXERR_VERBOSITY_NORMAL);
  }
}
