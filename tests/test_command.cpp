/**
 * @file test_command.cpp
 * @brief Tests for command line parsing
 */

#include "test_framework.h"
#include "core/command.h"

#include <string.h>

#include <string>
#include <vector>

// Parse a command line given without the program name
static bool parse(std::vector<std::string> words, latexerr_context_t *ctx) {
  words.insert(words.begin(), "latexerr");
  std::vector<char *> argv;
  for (auto &word : words) {
    argv.push_back(&word[0]);
  }
  argv.push_back(nullptr);
  return latexerr_parse_args(static_cast<latexerr_int_t>(words.size()),
                             argv.data(), ctx);
}

TEST(Command, NoArguments) {
  latexerr_context_t ctx;
  bool ok = parse({}, &ctx);

  test_assert(ok);
  test_assert(ctx.args.command == NULL);
  test_assert(ctx.args.arg_count == 0);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, ExplicitCheck) {
  latexerr_context_t ctx;
  bool ok = parse({"check", "a.log", "b.log", "--flat", "--no-color"}, &ctx);

  test_assert(ok);
  test_assert(strcmp(ctx.args.command, "check") == 0);
  test_assert(ctx.args.arg_count == 2);
  test_assert(strcmp(ctx.args.args[0], "a.log") == 0);
  test_assert(strcmp(ctx.args.args[1], "b.log") == 0);
  test_assert(ctx.args.flat);
  test_assert(ctx.args.no_color);
  test_assert(!ctx.args.no_dedup);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, LogFileImpliesCheck) {
  latexerr_context_t ctx;
  bool ok = parse({"thesis.log", "--rules", "undefined-control-sequence"},
                  &ctx);

  test_assert(ok);
  test_assert(strcmp(ctx.args.command, "check") == 0);
  test_assert(ctx.args.arg_count == 1);
  test_assert(strcmp(ctx.args.args[0], "thesis.log") == 0);
  test_assert(strcmp(ctx.args.rules, "undefined-control-sequence") == 0);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, OptionValueForms) {
  latexerr_context_t ctx;
  bool ok = parse({"check", "--config=my.toml", "--disable", "a,b", "-q",
                   "x.log"},
                  &ctx);

  test_assert(ok);
  test_assert(strcmp(ctx.args.config, "my.toml") == 0);
  test_assert(strcmp(ctx.args.disabled, "a,b") == 0);
  test_assert(strcmp(ctx.args.verbosity, "quiet") == 0);
  test_assert(ctx.args.arg_count == 1);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, LeadingOptionImpliesCheck) {
  latexerr_context_t ctx;
  bool ok = parse({"--no-summary", "-v", "x.log"}, &ctx);

  test_assert(ok);
  test_assert(strcmp(ctx.args.command, "check") == 0);
  test_assert(ctx.args.no_summary);
  test_assert(strcmp(ctx.args.verbosity, "verbose") == 0);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, HelpAndVersionFlags) {
  latexerr_context_t ctx;

  test_assert(parse({"--help"}, &ctx));
  test_assert(strcmp(ctx.args.command, "help") == 0);
  latexerr_free_args(&ctx.args);

  test_assert(parse({"--version"}, &ctx));
  test_assert(strcmp(ctx.args.command, "version") == 0);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, HelpTopic) {
  latexerr_context_t ctx;
  bool ok = parse({"help", "check"}, &ctx);

  test_assert(ok);
  test_assert(strcmp(ctx.args.command, "help") == 0);
  test_assert(ctx.args.arg_count == 1);
  test_assert(strcmp(ctx.args.args[0], "check") == 0);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, UnknownOption) {
  latexerr_context_t ctx;
  bool ok = parse({"check", "--frobnicate", "x.log"}, &ctx);

  test_assert(!ok);
  latexerr_free_args(&ctx.args);
  return 0;
}

TEST(Command, MissingOptionValue) {
  latexerr_context_t ctx;
  bool ok = parse({"check", "x.log", "--rules"}, &ctx);

  test_assert(!ok);
  latexerr_free_args(&ctx.args);
  return 0;
}
