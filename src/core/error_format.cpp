/**
 * @file error_format.cpp
 * @brief Implementation of diagnostic formatting utilities
 */

#include "core/error_format.hpp"

#include <algorithm>
#include <map>
#include <sstream>

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>

namespace latexerr {

namespace {

const auto ERROR_COLOR = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
const auto WARNING_COLOR = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
const auto FILE_COLOR = fmt::fg(fmt::color::cyan) | fmt::emphasis::bold;
const auto LOCATION_COLOR = fmt::fg(fmt::color::white) | fmt::emphasis::bold;
const auto ARROW_COLOR = fmt::fg(fmt::color::cyan);
const auto SUCCESS_COLOR = fmt::fg(fmt::color::green) | fmt::emphasis::bold;

fmt::text_style styled(bool color, fmt::text_style style) {
  return color ? style : fmt::text_style();
}

fmt::text_style level_style(diagnostic_level level) {
  return level == diagnostic_level::ERROR ? ERROR_COLOR : WARNING_COLOR;
}

std::string message_with_count(const diagnostic &diag) {
  if (diag.occurrence_count > 1) {
    return fmt::format("{} ({} occurrences)", diag.message,
                       diag.occurrence_count);
  }
  return diag.message;
}

// 0: no position, 1: source line, 2: end of file
int location_rank(const diagnostic &diag) {
  if (diag.line_number > 0) {
    return 1;
  }
  return diag.at_end ? 2 : 0;
}

std::string plural(int count, const char *noun) {
  return fmt::format("{} {}{}", count, noun, count == 1 ? "" : "s");
}

} // namespace

std::string format_location(const diagnostic &diag) {
  if (diag.line_number > 0) {
    if (diag.end_line > diag.line_number) {
      return fmt::format("lines {}--{}", diag.line_number, diag.end_line);
    }
    return fmt::format("line {}", diag.line_number);
  }
  if (diag.at_end) {
    return "the end";
  }
  return "";
}

std::string format_diagnostic_item(const diagnostic &diag, bool color) {
  std::string result =
      fmt::format(styled(color, level_style(diag.level)), "{}",
                  level_name(diag.level));

  if (diag.line_number > 0) {
    result += " on ";
    result += fmt::format(styled(color, LOCATION_COLOR), "{}",
                          format_location(diag));
  } else if (diag.at_end) {
    result += " at ";
    result += fmt::format(styled(color, LOCATION_COLOR), "{}",
                          format_location(diag));
  }

  result += ": " + message_with_count(diag);
  return result;
}

// Format a diagnostic in Cargo/Rust style
std::string format_diagnostic_to_string(const diagnostic &diag, bool color) {
  std::stringstream ss;

  // Cargo-style header: "error[undefined-control-sequence]: Unknown command"
  std::string level_str =
      diag.level == diagnostic_level::ERROR ? "error" : "warning";
  ss << fmt::format(styled(color, level_style(diag.level)), "{}", level_str);
  if (!diag.code.empty()) {
    ss << fmt::format(styled(color, level_style(diag.level)), "[{}]",
                      diag.code);
  }
  ss << ": " << message_with_count(diag) << "\n";

  // File location: "  --> chapter1.tex:10"
  if (!diag.file_path.empty() || diag.line_number > 0 || diag.at_end) {
    ss << fmt::format(styled(color, ARROW_COLOR), "  --> ");
    if (!diag.file_path.empty()) {
      ss << diag.file_path;
      if (diag.line_number > 0) {
        ss << ":" << diag.line_number;
        if (diag.end_line > diag.line_number) {
          ss << "-" << diag.end_line;
        }
      } else if (diag.at_end) {
        ss << " (at the end)";
      }
    } else {
      ss << format_location(diag);
    }
    ss << "\n";
  }

  return ss.str();
}

std::vector<diagnostic>
deduplicate_diagnostics(std::vector<diagnostic> diagnostics) {
  std::vector<diagnostic> result;
  std::map<std::string, size_t> seen;

  for (auto &diag : diagnostics) {
    std::string key = fmt::format(
        "{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}",
        static_cast<int>(diag.level), diag.code, diag.message, diag.file_path,
        diag.line_number, diag.end_line, diag.at_end ? 1 : 0);

    auto it = seen.find(key);
    if (it != seen.end()) {
      result[it->second].occurrence_count += diag.occurrence_count;
      continue;
    }

    seen.emplace(key, result.size());
    result.push_back(std::move(diag));
  }

  return result;
}

void sort_by_location(std::vector<diagnostic> &diagnostics) {
  std::stable_sort(diagnostics.begin(), diagnostics.end(),
                   [](const diagnostic &a, const diagnostic &b) {
                     int rank_a = location_rank(a);
                     int rank_b = location_rank(b);
                     if (rank_a != rank_b) {
                       return rank_a < rank_b;
                     }
                     return rank_a == 1 && a.line_number < b.line_number;
                   });
}

std::vector<std::pair<std::string, std::vector<diagnostic>>>
group_by_file(const std::vector<diagnostic> &diagnostics) {
  // std::map orders by name, and the empty name sorts first
  std::map<std::string, std::vector<diagnostic>> by_file;
  for (const auto &diag : diagnostics) {
    by_file[diag.file_path].push_back(diag);
  }

  std::vector<std::pair<std::string, std::vector<diagnostic>>> groups;
  for (auto &entry : by_file) {
    sort_by_location(entry.second);
    groups.emplace_back(entry.first, std::move(entry.second));
  }
  return groups;
}

std::string format_report(const std::vector<diagnostic> &diagnostics,
                          const format_options &options) {
  std::vector<diagnostic> items = options.deduplicate
                                      ? deduplicate_diagnostics(diagnostics)
                                      : diagnostics;
  std::stringstream ss;

  if (options.group_by_file) {
    auto groups = group_by_file(items);
    for (size_t i = 0; i < groups.size(); ++i) {
      const auto &name = groups[i].first;
      ss << fmt::format(styled(options.color, FILE_COLOR), "File:") << " "
         << (name.empty() ? "(no file)" : name) << "\n\n";

      for (const auto &diag : groups[i].second) {
        ss << format_diagnostic_item(diag, options.color) << "\n";
      }

      // No blank line after the last file
      if (i + 1 < groups.size()) {
        ss << "\n";
      }
    }
  } else {
    for (const auto &diag : items) {
      ss << format_diagnostic_to_string(diag, options.color);
    }
  }

  if (options.summary) {
    if (!items.empty()) {
      ss << "\n";
    }
    ss << format_error_summary(calculate_error_summary(items), options.color)
       << "\n";
  }

  return ss.str();
}

error_summary
calculate_error_summary(const std::vector<diagnostic> &diagnostics) {
  error_summary summary;
  std::map<std::string, size_t> rule_index;

  for (const auto &diag : diagnostics) {
    if (diag.level == diagnostic_level::ERROR) {
      summary.total_errors += diag.occurrence_count;
    } else {
      summary.total_warnings += diag.occurrence_count;
    }

    auto it = rule_index.find(diag.code);
    if (it == rule_index.end()) {
      rule_index.emplace(diag.code, summary.rule_counts.size());
      summary.rule_counts.emplace_back(diag.code, diag.occurrence_count);
    } else {
      summary.rule_counts[it->second].second += diag.occurrence_count;
    }
  }

  return summary;
}

std::string format_error_summary(const error_summary &summary, bool color) {
  if (summary.total_errors == 0 && summary.total_warnings == 0) {
    return fmt::format(styled(color, SUCCESS_COLOR), "No problems found");
  }

  std::stringstream ss;
  ss << fmt::format(styled(color, summary.total_errors > 0 ? ERROR_COLOR
                                                           : WARNING_COLOR),
                    "{}, {}", plural(summary.total_errors, "error"),
                    plural(summary.total_warnings, "warning"));

  for (const auto &entry : summary.rule_counts) {
    ss << "\n" << fmt::format("{:>6} {}", entry.second, entry.first);
  }

  return ss.str();
}

} // namespace latexerr
