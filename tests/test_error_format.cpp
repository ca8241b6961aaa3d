/**
 * @file test_error_format.cpp
 * @brief Tests for grouping, deduplication and rendering of diagnostics
 */

#include "test_framework.h"
#include "core/error_format.hpp"

#include <string>
#include <vector>

using namespace latexerr;

static diagnostic make_diag(diagnostic_level level, const std::string &code,
                            const std::string &message,
                            const std::string &file, int line = 0,
                            int end_line = 0) {
  diagnostic diag;
  diag.level = level;
  diag.code = code;
  diag.message = message;
  diag.file_path = file;
  diag.line_number = line;
  diag.end_line = end_line;
  return diag;
}

static format_options plain_options() {
  format_options options;
  options.color = false;
  return options;
}

static std::vector<diagnostic> sample_diagnostics() {
  return {
      make_diag(diagnostic_level::ERROR, "undefined-control-sequence",
                "Unknown command \\foo.", "main.tex", 4),
      make_diag(diagnostic_level::WARNING, "underfull-box",
                "Line cannot be stretched enough.", "main.tex", 5, 7),
      make_diag(diagnostic_level::ERROR, "missing-package",
                "Missing package foo.", ""),
  };
}

TEST(ErrorFormat, Location) {
  auto single = make_diag(diagnostic_level::ERROR, "x", "m", "", 12);
  auto range = make_diag(diagnostic_level::ERROR, "x", "m", "", 5, 7);
  auto none = make_diag(diagnostic_level::ERROR, "x", "m", "");
  auto end = none;
  end.at_end = true;

  test_assert_str(format_location(single), "line 12");
  test_assert_str(format_location(range), "lines 5--7");
  test_assert_str(format_location(none), "");
  test_assert_str(format_location(end), "the end");
  return 0;
}

TEST(ErrorFormat, Items) {
  auto diags = sample_diagnostics();
  auto end = make_diag(diagnostic_level::ERROR, "runaway-argument",
                       "Command \\date was not properly ended with curly "
                       "brace.",
                       "main.tex");
  end.at_end = true;

  test_assert_str(format_diagnostic_item(diags[0], false),
                  "Error on line 4: Unknown command \\foo.");
  test_assert_str(format_diagnostic_item(diags[1], false),
                  "Warning on lines 5--7: Line cannot be stretched enough.");
  test_assert_str(format_diagnostic_item(diags[2], false),
                  "Error: Missing package foo.");
  test_assert_str(format_diagnostic_item(end, false),
                  "Error at the end: Command \\date was not properly ended "
                  "with curly brace.");
  return 0;
}

TEST(ErrorFormat, CargoStyle) {
  auto diags = sample_diagnostics();

  test_assert_str(format_diagnostic_to_string(diags[0], false),
                  "error[undefined-control-sequence]: Unknown command \\foo.\n"
                  "  --> main.tex:4\n");
  test_assert_str(format_diagnostic_to_string(diags[1], false),
                  "warning[underfull-box]: Line cannot be stretched enough.\n"
                  "  --> main.tex:5-7\n");
  test_assert_str(format_diagnostic_to_string(diags[2], false),
                  "error[missing-package]: Missing package foo.\n");
  return 0;
}

TEST(ErrorFormat, ColorAddsEscapes) {
  auto diags = sample_diagnostics();

  std::string colored = format_diagnostic_item(diags[0], true);
  test_assert(colored.find("\x1b[") != std::string::npos);
  test_assert(format_diagnostic_item(diags[0], false).find("\x1b[") ==
              std::string::npos);
  return 0;
}

TEST(ErrorFormat, Deduplicate) {
  auto first = make_diag(diagnostic_level::ERROR, "undefined-control-sequence",
                         "Unknown command \\foo.", "main.tex", 4);
  auto other = make_diag(diagnostic_level::ERROR, "undefined-control-sequence",
                         "Unknown command \\foo.", "main.tex", 9);

  auto result = deduplicate_diagnostics({first, other, first, first});

  test_assert(result.size() == 2);
  test_assert(result[0].occurrence_count == 3);
  test_assert(result[0].line_number == 4);
  test_assert(result[1].occurrence_count == 1);
  test_assert_str(format_diagnostic_item(result[0], false),
                  "Error on line 4: Unknown command \\foo. (3 occurrences)");
  return 0;
}

TEST(ErrorFormat, SortByLocation) {
  auto late = make_diag(diagnostic_level::ERROR, "a", "late", "f.tex", 30);
  auto early = make_diag(diagnostic_level::ERROR, "a", "early", "f.tex", 2);
  auto none = make_diag(diagnostic_level::ERROR, "a", "none", "f.tex");
  auto end = make_diag(diagnostic_level::ERROR, "a", "end", "f.tex");
  end.at_end = true;

  std::vector<diagnostic> diags = {end, late, none, early};
  sort_by_location(diags);

  test_assert_str(diags[0].message, "none");
  test_assert_str(diags[1].message, "early");
  test_assert_str(diags[2].message, "late");
  test_assert_str(diags[3].message, "end");
  return 0;
}

TEST(ErrorFormat, GroupByFile) {
  std::vector<diagnostic> diags = {
      make_diag(diagnostic_level::ERROR, "a", "one", "b.tex", 3),
      make_diag(diagnostic_level::ERROR, "a", "two", "", 0),
      make_diag(diagnostic_level::ERROR, "a", "three", "a.tex", 1),
      make_diag(diagnostic_level::ERROR, "a", "four", "b.tex", 1),
  };

  auto groups = group_by_file(diags);

  test_assert(groups.size() == 3);
  test_assert_str(groups[0].first, "");
  test_assert_str(groups[1].first, "a.tex");
  test_assert_str(groups[2].first, "b.tex");
  test_assert(groups[2].second.size() == 2);
  test_assert_str(groups[2].second[0].message, "four");
  return 0;
}

TEST(ErrorFormat, GroupedReport) {
  std::string report = format_report(sample_diagnostics(), plain_options());

  test_assert_str(report, "File: (no file)\n"
                          "\n"
                          "Error: Missing package foo.\n"
                          "\n"
                          "File: main.tex\n"
                          "\n"
                          "Error on line 4: Unknown command \\foo.\n"
                          "Warning on lines 5--7: Line cannot be stretched "
                          "enough.\n"
                          "\n"
                          "2 errors, 1 warning\n"
                          "     1 undefined-control-sequence\n"
                          "     1 underfull-box\n"
                          "     1 missing-package\n");
  return 0;
}

TEST(ErrorFormat, FlatReportWithoutSummary) {
  format_options options = plain_options();
  options.group_by_file = false;
  options.summary = false;

  auto diags = sample_diagnostics();
  std::string report = format_report({diags[0], diags[2]}, options);

  test_assert_str(report,
                  "error[undefined-control-sequence]: Unknown command \\foo.\n"
                  "  --> main.tex:4\n"
                  "error[missing-package]: Missing package foo.\n");
  return 0;
}

TEST(ErrorFormat, ReportKeepsDuplicatesWhenAsked) {
  format_options options = plain_options();
  options.deduplicate = false;
  options.summary = false;

  auto diag = sample_diagnostics()[0];
  std::string report = format_report({diag, diag}, options);

  test_assert_str(report, "File: main.tex\n"
                          "\n"
                          "Error on line 4: Unknown command \\foo.\n"
                          "Error on line 4: Unknown command \\foo.\n");
  return 0;
}

TEST(ErrorFormat, EmptyReport) {
  test_assert_str(format_report({}, plain_options()), "No problems found\n");
  return 0;
}

TEST(ErrorFormat, Summary) {
  auto diags = sample_diagnostics();
  diags.push_back(diags[0]);
  diags.back().occurrence_count = 2;

  error_summary summary = calculate_error_summary(diags);

  test_assert(summary.total_errors == 4);
  test_assert(summary.total_warnings == 1);
  test_assert(summary.rule_counts.size() == 3);
  test_assert_str(summary.rule_counts[0].first, "undefined-control-sequence");
  test_assert(summary.rule_counts[0].second == 3);

  test_assert_str(format_error_summary(error_summary(), false),
                  "No problems found");
  return 0;
}
