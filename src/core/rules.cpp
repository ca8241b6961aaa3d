/**
 * @file rules.cpp
 * @brief Signatures and messages of the detection rules
 */

#include "core/rules.hpp"

#include <fmt/core.h>

#include <iterator>
#include <regex>
#include <stdexcept>

namespace latexerr {

namespace {

struct rule_info {
  const char *name;
  const char *description;
  diagnostic_level level;
};

// Default registration order
const rule_kind RULE_ORDER[] = {
    rule_kind::UNDEFINED_CONTROL_SEQUENCE, rule_kind::BRACE_MISMATCH,
    rule_kind::NOT_IN_MATH_MODE,           rule_kind::RUNAWAY_ARGUMENT,
    rule_kind::UNDERFULL_BOX,              rule_kind::OVERFULL_BOX,
    rule_kind::MISSING_PACKAGE,            rule_kind::INVALID_OPTION,
    rule_kind::ALIGNMENT_TAB_MISMATCH,     rule_kind::UNDEFINED_ENVIRONMENT,
    rule_kind::UNDEFINED_REFERENCE,
};

rule_info info_for(rule_kind kind) {
  switch (kind) {
  case rule_kind::UNDEFINED_CONTROL_SEQUENCE:
    return {"undefined-control-sequence",
            "A command that is not defined was used", diagnostic_level::ERROR};
  case rule_kind::BRACE_MISMATCH:
    return {"brace-mismatch", "Curly braces do not balance",
            diagnostic_level::ERROR};
  case rule_kind::NOT_IN_MATH_MODE:
    return {"not-in-math-mode", "Math-only input was used outside math mode",
            diagnostic_level::ERROR};
  case rule_kind::RUNAWAY_ARGUMENT:
    return {"runaway-argument",
            "A command argument was not closed with a curly brace",
            diagnostic_level::ERROR};
  case rule_kind::UNDERFULL_BOX:
    return {"underfull-box", "A line or page could not be stretched enough",
            diagnostic_level::WARNING};
  case rule_kind::OVERFULL_BOX:
    return {"overfull-box", "A line or page overflows its box",
            diagnostic_level::WARNING};
  case rule_kind::MISSING_PACKAGE:
    return {"missing-package", "A package, class or input file was not found",
            diagnostic_level::ERROR};
  case rule_kind::INVALID_OPTION:
    return {"invalid-option",
            "A package or class was given an unknown option",
            diagnostic_level::ERROR};
  case rule_kind::ALIGNMENT_TAB_MISMATCH:
    return {"alignment-tab-mismatch",
            "Wrong number of &'s in a table, array or eqnarray row",
            diagnostic_level::ERROR};
  case rule_kind::UNDEFINED_ENVIRONMENT:
    return {"undefined-environment",
            "An environment that is not defined was used",
            diagnostic_level::ERROR};
  case rule_kind::UNDEFINED_REFERENCE:
    return {"undefined-reference", "A \\ref or \\cite key is not defined",
            diagnostic_level::WARNING};
  }
  throw std::invalid_argument("Unhandled rule kind");
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

std::string rtrim(const std::string &s) {
  size_t end = s.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    return "";
  }
  return s.substr(0, end + 1);
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<int> parse_number(const std::string &digits) {
  try {
    return std::stoi(digits);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

match_span make_span(const std::vector<log_line> &lines, std::size_t first,
                     std::size_t last) {
  match_span span;
  span.first_line = lines[first].number;
  span.line_count = last - first + 1;
  return span;
}

/**
 * @brief Search a message TeX may have broken at max_print_line
 *
 * Lines exactly max_print_line long are joined with the following line, up
 * to a few times, before searching. On success the index of the last line
 * the match reaches is returned; matches refers into joined.
 */
std::optional<std::size_t> search_wrapped(const std::vector<log_line> &lines,
                                          std::size_t index,
                                          std::size_t max_print_line,
                                          const std::regex &pattern,
                                          std::string &joined,
                                          std::smatch &matches) {
  joined = lines[index].text;
  std::size_t last = index;
  while (max_print_line > 0 && lines[last].text.size() == max_print_line &&
         last + 1 < lines.size() && last < index + 3) {
    ++last;
    joined += lines[last].text;
  }

  if (!std::regex_search(joined, matches, pattern)) {
    return std::nullopt;
  }

  // Only claim the lines the message actually occupies
  std::size_t end = static_cast<std::size_t>(matches.position(0) +
                                             matches.length(0));
  std::size_t covered = 0;
  for (std::size_t j = index; j <= last; ++j) {
    covered += lines[j].text.size();
    if (covered >= end) {
      return j;
    }
  }
  return last;
}

/**
 * @brief The "l.<N> <source text>" line TeX prints to show where it stopped
 */
struct context_line {
  std::size_t index = 0;
  int number = 0;
  std::string text;
};

// Looks a few lines ahead, but never past the start of another error
std::optional<context_line>
find_context_line(const std::vector<log_line> &lines, std::size_t from) {
  static const std::regex location_regex(R"(^l\.(\d+)(?:\s(.*))?$)");
  static const std::regex file_line_regex(R"(^\S+:\d+: )");

  for (std::size_t j = from;
       j < lines.size() && j < from + LATEXERR_CONTEXT_LOOKAHEAD; ++j) {
    const std::string &text = lines[j].text;
    if (starts_with(text, "! ") || std::regex_search(text, file_line_regex)) {
      break;
    }

    std::smatch matches;
    if (std::regex_match(text, matches, location_regex)) {
      auto number = parse_number(matches[1].str());
      if (!number) {
        return std::nullopt;
      }
      context_line ctx;
      ctx.index = j;
      ctx.number = *number;
      ctx.text = matches[2].matched ? matches[2].str() : "";
      return ctx;
    }
  }
  return std::nullopt;
}

// TeX prints the remainder of the source line below l.<N>, indented
std::size_t context_tail(const std::vector<log_line> &lines,
                         std::size_t index) {
  std::size_t next = index + 1;
  if (next < lines.size()) {
    const std::string &text = lines[next].text;
    if (!text.empty() && text[0] == ' ' && !trim(text).empty()) {
      return 1;
    }
  }
  return 0;
}

std::size_t context_end(const std::vector<log_line> &lines,
                        const context_line &ctx) {
  return ctx.index + context_tail(lines, ctx.index);
}

std::string last_control_sequence(const std::string &text) {
  static const std::regex cs_regex(R"(\\(?:[A-Za-z@]+|[^A-Za-z@\s]))");

  std::string found;
  for (std::sregex_iterator it(text.begin(), text.end(), cs_regex), end;
       it != end; ++it) {
    found = it->str();
  }
  return found;
}

/**
 * @brief Span from a header line through its l.<N> context
 *
 * Captures the variant tag and the source text TeX showed. Shared by every
 * "! <message>" error whose only payload is where it happened.
 */
std::optional<match_span>
match_with_context(const std::vector<log_line> &lines, std::size_t first,
                   std::size_t search_from, const std::string &variant) {
  auto ctx = find_context_line(lines, search_from);
  if (!ctx) {
    return std::nullopt;
  }

  match_span span = make_span(lines, first, context_end(lines, *ctx));
  span.captures = {variant, trim(ctx->text)};
  span.source_line = ctx->number;
  return span;
}

std::optional<match_span>
match_undefined_control_sequence(const std::vector<log_line> &lines,
                                 std::size_t index) {
  // "! Undefined control sequence." or, with -file-line-error,
  // "./main.tex:12: Undefined control sequence."
  if (!ends_with(rtrim(lines[index].text), "Undefined control sequence.")) {
    return std::nullopt;
  }

  auto ctx = find_context_line(lines, index + 1);
  if (!ctx) {
    return std::nullopt;
  }

  // The offending token is the last one before TeX broke the line
  std::string command = last_control_sequence(ctx->text);
  if (command.empty()) {
    for (std::size_t j = index + 1; j < ctx->index; ++j) {
      std::string candidate = last_control_sequence(lines[j].text);
      if (!candidate.empty()) {
        command = candidate;
      }
    }
  }

  match_span span = make_span(lines, index, context_end(lines, *ctx));
  span.captures = {command};
  span.source_line = ctx->number;
  return span;
}

std::optional<match_span>
match_brace_mismatch(const std::vector<log_line> &lines, std::size_t index) {
  std::string header = rtrim(lines[index].text);
  if (header == "! Too many }'s.") {
    return match_with_context(lines, index, index + 1, "too-many");
  }
  if (header == "! Missing } inserted.") {
    return match_with_context(lines, index, index + 1, "missing-close");
  }
  if (header == "! Missing { inserted.") {
    return match_with_context(lines, index, index + 1, "missing-open");
  }
  return std::nullopt;
}

std::optional<match_span>
match_not_in_math_mode(const std::vector<log_line> &lines, std::size_t index) {
  if (rtrim(lines[index].text) != "! Missing $ inserted.") {
    return std::nullopt;
  }
  if (index + 2 >= lines.size()) {
    return std::nullopt;
  }
  if (!starts_with(lines[index + 1].text, "<inserted text>")) {
    return std::nullopt;
  }
  std::string inserted = trim(lines[index + 2].text);
  if (inserted.empty() || inserted.back() != '$') {
    return std::nullopt;
  }

  auto span = match_with_context(lines, index, index + 3, "");
  if (!span) {
    return std::nullopt;
  }

  // TeX complains a second time where the paragraph ends and math mode is
  // left again. That half carries no source text and is dropped.
  bool closing = span->captures[1].empty();
  std::size_t last = index + span->line_count - 1;
  for (std::size_t j = index + 3; j + 1 <= last; ++j) {
    if (starts_with(lines[j].text, "<to be read again>") &&
        trim(lines[j + 1].text) == "\\par") {
      closing = true;
    }
  }
  span->silent = closing;
  return span;
}

std::optional<match_span>
match_runaway_argument(const std::vector<log_line> &lines, std::size_t index) {
  static const std::regex paragraph_regex(
      R"(^! Paragraph ended before (\S+) was complete\.)");
  static const std::regex file_regex(
      R"(^! File ended while scanning use of (\S+)\.)");

  if (rtrim(lines[index].text) != "Runaway argument?") {
    return std::nullopt;
  }

  // The runaway text itself may be wrapped over a few lines
  for (std::size_t j = index + 2; j < lines.size() && j <= index + 4; ++j) {
    const std::string &text = lines[j].text;
    std::smatch matches;

    if (std::regex_search(text, matches, paragraph_regex)) {
      std::string command = matches[1].str();
      auto ctx = find_context_line(lines, j + 1);
      if (!ctx) {
        return std::nullopt;
      }
      match_span span = make_span(lines, index, context_end(lines, *ctx));
      span.captures = {command};
      // TeX notices the missing brace at the blank line after the paragraph
      span.source_line = ctx->number > 1 ? ctx->number - 1 : ctx->number;
      return span;
    }

    if (std::regex_search(text, matches, file_regex)) {
      match_span span = make_span(lines, index, j);
      span.captures = {matches[1].str()};
      span.at_end = true;
      return span;
    }

    if (starts_with(text, "! ")) {
      break;
    }
  }
  return std::nullopt;
}

/**
 * @brief Text of a box display with font selectors and markers removed
 *
 * "[]\OT1/cmr/m/n/10 Lorem ip-sum" becomes "Lorem ip-sum". Wrapped lines
 * are joined without a separator since TeX breaks them mid-word.
 */
std::string box_content(const std::vector<log_line> &lines, std::size_t first,
                        std::size_t last) {
  static const std::regex font_regex(R"(\\[A-Za-z0-9]+/\S+ ?)");

  std::string joined;
  for (std::size_t j = first; j < last; ++j) {
    joined += lines[j].text;
  }
  joined = trim(joined);

  if (starts_with(joined, "[]") || starts_with(joined, "\\")) {
    size_t space = joined.find(' ');
    joined = space == std::string::npos ? "" : joined.substr(space + 1);
  }

  joined = std::regex_replace(joined, font_regex, "");
  joined = trim(joined);
  while (ends_with(joined, "[]")) {
    joined = trim(joined.substr(0, joined.size() - 2));
  }
  return joined;
}

std::optional<match_span> match_box(const std::vector<log_line> &lines,
                                    std::size_t index, bool underfull) {
  static const std::regex box_regex(
      R"(^(Underfull|Overfull) \\([hv]box) \(([^)]*)\) )"
      R"((?:((?:in paragraph|in alignment) at lines (\d+)--(\d+))|)"
      R"((detected at line (\d+))|(has occurred while \\output is active)))");

  const std::string &header = lines[index].text;
  std::smatch matches;
  if (!std::regex_search(header, matches, box_regex)) {
    return std::nullopt;
  }
  if ((matches[1].str() == "Underfull") != underfull) {
    return std::nullopt;
  }

  int first_line = 0;
  int end_line = 0;
  std::string where;
  if (matches[4].matched) {
    auto from = parse_number(matches[5].str());
    auto to = parse_number(matches[6].str());
    if (!from || !to) {
      return std::nullopt;
    }
    first_line = *from;
    end_line = *to;
    where = matches[4].str();
  } else if (matches[7].matched) {
    auto at = parse_number(matches[8].str());
    if (!at) {
      return std::nullopt;
    }
    first_line = *at;
    where = matches[7].str();
  } else {
    where = "while \\output is active";
  }

  // Box display runs until a line holding only "[]"
  std::size_t last = index;
  std::string content;
  if (!ends_with(rtrim(header), "[]")) {
    for (std::size_t j = index + 1;
         j < lines.size() && j <= index + LATEXERR_BOX_LOOKAHEAD; ++j) {
      const std::string &text = lines[j].text;
      if (trim(text) == "[]") {
        content = box_content(lines, index + 1, j);
        last = j;
        break;
      }
      if (starts_with(text, "! ") || starts_with(text, "Underfull ") ||
          starts_with(text, "Overfull ")) {
        break;
      }
    }
  }

  match_span span = make_span(lines, index, last);
  span.captures = {matches[2].str(), matches[3].str(), where, content};
  span.source_line = first_line;
  span.end_line = end_line;
  return span;
}

std::optional<match_span>
match_missing_package(const std::vector<log_line> &lines, std::size_t index,
                      std::size_t max_print_line) {
  static const std::regex file_regex(
      R"(^! LaTeX Error: File `([^']+)' not found\.)");

  if (!starts_with(lines[index].text, "! LaTeX Error: File `")) {
    return std::nullopt;
  }

  std::string joined;
  std::smatch matches;
  auto last = search_wrapped(lines, index, max_print_line, file_regex, joined,
                             matches);
  if (!last) {
    return std::nullopt;
  }

  std::string file = matches[1].str();
  std::string name = file;
  std::string extension;
  size_t dot = file.rfind('.');
  if (dot != std::string::npos && dot > 0) {
    name = file.substr(0, dot);
    extension = file.substr(dot + 1);
  }

  match_span span = make_span(lines, index, *last);
  span.captures = {name, extension};
  return span;
}

std::optional<match_span>
match_invalid_option(const std::vector<log_line> &lines, std::size_t index,
                     std::size_t max_print_line) {
  static const std::regex option_regex(
      R"(^! LaTeX Error: Unknown option `([^']*)')"
      R"((?: for (package|class) `([^']+)'\.)?)");

  if (!starts_with(lines[index].text, "! LaTeX Error: Unknown option")) {
    return std::nullopt;
  }

  std::string joined;
  std::smatch matches;
  auto last = search_wrapped(lines, index, max_print_line, option_regex,
                             joined, matches);
  if (!last) {
    return std::nullopt;
  }

  match_span span = make_span(lines, index, *last);
  span.captures = {matches[1].str(), matches[2].str(), matches[3].str()};
  return span;
}

std::optional<match_span>
match_alignment_tab(const std::vector<log_line> &lines, std::size_t index) {
  std::string header = rtrim(lines[index].text);
  if (header == "! Extra alignment tab has been changed to \\cr.") {
    return match_with_context(lines, index, index + 1, "extra");
  }
  if (header == "! Misplaced alignment tab character &.") {
    return match_with_context(lines, index, index + 1, "misplaced");
  }
  return std::nullopt;
}

std::optional<match_span>
match_undefined_environment(const std::vector<log_line> &lines,
                            std::size_t index, std::size_t max_print_line) {
  static const std::regex environment_regex(
      R"(^! LaTeX Error: Environment (\S+) undefined\.)");

  if (!starts_with(lines[index].text, "! LaTeX Error: Environment ")) {
    return std::nullopt;
  }

  std::string joined;
  std::smatch matches;
  auto last = search_wrapped(lines, index, max_print_line, environment_regex,
                             joined, matches);
  if (!last) {
    return std::nullopt;
  }

  std::string environment = matches[1].str();
  match_span span;
  auto ctx = find_context_line(lines, *last + 1);
  if (ctx) {
    span = make_span(lines, index, context_end(lines, *ctx));
    span.source_line = ctx->number;
  } else {
    span = make_span(lines, index, *last);
  }
  span.captures = {environment};
  return span;
}

std::optional<match_span>
match_undefined_reference(const std::vector<log_line> &lines,
                          std::size_t index, std::size_t max_print_line) {
  static const std::regex reference_regex(
      R"(^(?:LaTeX|Package natbib) Warning: (Reference|Citation) `([^']+)' )"
      R"(on page (\S+) undefined on input line (\d+)\.)");

  const std::string &text = lines[index].text;
  if (!starts_with(text, "LaTeX Warning: ") &&
      !starts_with(text, "Package natbib Warning: ")) {
    return std::nullopt;
  }

  // Long keys push the warning past max_print_line onto following lines
  std::string joined;
  std::smatch matches;
  auto last = search_wrapped(lines, index, max_print_line, reference_regex,
                             joined, matches);
  if (!last) {
    return std::nullopt;
  }
  auto number = parse_number(matches[4].str());
  if (!number) {
    return std::nullopt;
  }

  match_span span = make_span(lines, index, *last);
  span.captures = {matches[1].str(), matches[2].str(), matches[3].str()};
  span.source_line = *number;
  return span;
}

const char *badness_verdict(const std::string &detail) {
  static const std::regex badness_regex(R"(badness (\d+))");

  std::smatch matches;
  if (!std::regex_search(detail, matches, badness_regex)) {
    return nullptr;
  }
  auto badness = parse_number(matches[1].str());
  if (!badness) {
    return "very bad";
  }
  if (*badness < 2000) {
    return "ignorable";
  }
  if (*badness < 6000) {
    return "not as bad";
  }
  return "very bad";
}

std::string render_message(rule_kind kind, const match_span &span) {
  const auto &c = span.captures;

  switch (kind) {
  case rule_kind::UNDEFINED_CONTROL_SEQUENCE:
    if (c[0].empty()) {
      return "Unknown command.";
    }
    return fmt::format("Unknown command {}.", c[0]);

  case rule_kind::BRACE_MISMATCH:
    if (c[0] == "missing-close") {
      return fmt::format("Missing closing curly brace near {}.", c[1]);
    }
    if (c[0] == "missing-open") {
      return fmt::format("Missing opening curly brace near {}.", c[1]);
    }
    return fmt::format("Number of curly braces near {} does not match.", c[1]);

  case rule_kind::NOT_IN_MATH_MODE:
    return fmt::format("String {} is valid only in math mode.", c[1]);

  case rule_kind::RUNAWAY_ARGUMENT:
    return fmt::format(
        "Command {} was not properly ended with curly brace.", c[0]);

  case rule_kind::UNDERFULL_BOX: {
    bool line_box = c[0] == "hbox";
    std::string message;
    if (c[3].empty()) {
      message = fmt::format("{} cannot be stretched enough ({}) {}.",
                            line_box ? "Line" : "Page", c[1], c[2]);
    } else {
      message = fmt::format(
          "Due to {} the {} cannot be stretched enough ({}) {}.", c[3],
          line_box ? "line" : "page", c[1], c[2]);
    }
    const char *verdict = badness_verdict(c[1]);
    if (verdict) {
      message += fmt::format(" The problem is {}.", verdict);
    }
    return message;
  }

  case rule_kind::OVERFULL_BOX:
    if (c[3].empty()) {
      return fmt::format("{} is {} {}.", c[0] == "hbox" ? "Line" : "Page",
                         c[1], c[2]);
    }
    return fmt::format(
        "Text after {} (displayed hyphenated) overflows the line end ({}) {}.",
        c[3], c[1], c[2]);

  case rule_kind::MISSING_PACKAGE:
    if (c[1] == "sty") {
      return fmt::format("Missing package {}.", c[0]);
    }
    if (c[1] == "cls") {
      return fmt::format("Missing document class {}.", c[0]);
    }
    if (c[1].empty()) {
      return fmt::format("Missing file {}.", c[0]);
    }
    return fmt::format("Missing file {}.{}.", c[0], c[1]);

  case rule_kind::INVALID_OPTION:
    if (c[1].empty()) {
      return fmt::format("Invalid option {}.", c[0]);
    }
    return fmt::format("Invalid option {} of {} {}.", c[0], c[1], c[2]);

  case rule_kind::ALIGNMENT_TAB_MISMATCH:
    if (c[0] == "misplaced") {
      return fmt::format("Character & is used outside of an aligned "
                         "environment (table, etc.) near {}.",
                         c[1]);
    }
    return fmt::format("There are more &'s than should be in an aligned "
                       "environment (table, etc.) near {}.",
                       c[1]);

  case rule_kind::UNDEFINED_ENVIRONMENT:
    return fmt::format("Environment {} is not defined.", c[0]);

  case rule_kind::UNDEFINED_REFERENCE:
    return fmt::format("{} {} on page {} is undefined.", c[0], c[1], c[2]);
  }
  return "";
}

} // namespace

const char *rule::name() const { return info_for(m_kind).name; }

const char *rule::description() const { return info_for(m_kind).description; }

diagnostic_level rule::level() const { return info_for(m_kind).level; }

std::optional<match_span> rule::try_match(const std::vector<log_line> &lines,
                                          std::size_t index,
                                          std::size_t max_print_line) const {
  if (index >= lines.size()) {
    return std::nullopt;
  }

  switch (m_kind) {
  case rule_kind::UNDEFINED_CONTROL_SEQUENCE:
    return match_undefined_control_sequence(lines, index);
  case rule_kind::BRACE_MISMATCH:
    return match_brace_mismatch(lines, index);
  case rule_kind::NOT_IN_MATH_MODE:
    return match_not_in_math_mode(lines, index);
  case rule_kind::RUNAWAY_ARGUMENT:
    return match_runaway_argument(lines, index);
  case rule_kind::UNDERFULL_BOX:
    return match_box(lines, index, true);
  case rule_kind::OVERFULL_BOX:
    return match_box(lines, index, false);
  case rule_kind::MISSING_PACKAGE:
    return match_missing_package(lines, index, max_print_line);
  case rule_kind::INVALID_OPTION:
    return match_invalid_option(lines, index, max_print_line);
  case rule_kind::ALIGNMENT_TAB_MISMATCH:
    return match_alignment_tab(lines, index);
  case rule_kind::UNDEFINED_ENVIRONMENT:
    return match_undefined_environment(lines, index, max_print_line);
  case rule_kind::UNDEFINED_REFERENCE:
    return match_undefined_reference(lines, index, max_print_line);
  }
  return std::nullopt;
}

diagnostic rule::render(const match_span &span,
                        const std::optional<std::string> &file) const {
  diagnostic diag;
  diag.level = level();
  diag.code = name();
  diag.message = render_message(m_kind, span);
  diag.file_path = file.value_or("");
  diag.line_number = span.source_line;
  diag.end_line = span.end_line;
  diag.at_end = span.at_end;
  diag.log_line = span.first_line;
  return diag;
}

std::vector<rule_kind> all_rule_kinds() {
  return std::vector<rule_kind>(std::begin(RULE_ORDER), std::end(RULE_ORDER));
}

std::vector<rule> default_rules() {
  std::vector<rule> rules;
  for (rule_kind kind : RULE_ORDER) {
    rules.emplace_back(kind);
  }
  return rules;
}

std::optional<rule> rule_from_name(const std::string &name) {
  for (rule_kind kind : RULE_ORDER) {
    if (name == info_for(kind).name) {
      return rule(kind);
    }
  }
  return std::nullopt;
}

} // namespace latexerr
