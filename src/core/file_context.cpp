/**
 * @file file_context.cpp
 * @brief Implementation of the open-file stack tracker
 */

#include "core/file_context.hpp"

#include <cctype>

namespace latexerr {

file_context_tracker::file_context_tracker(std::size_t max_print_line)
    : m_max_print_line(max_print_line) {}

void file_context_tracker::observe(const log_line &line) {
  for (char c : line.text) {
    if (m_reading_token) {
      // Quoted names ("./my file.tex") may contain spaces and parentheses
      if (m_quoted) {
        if (c == '"') {
          m_quoted = false;
        } else {
          m_pending += c;
        }
        continue;
      }

      if (c == '"' && m_pending.empty()) {
        m_quoted = true;
        continue;
      }

      if (!std::isspace(static_cast<unsigned char>(c)) && c != '(' &&
          c != ')') {
        m_pending += c;
        continue;
      }

      finish_token();
    }

    if (c == '(') {
      m_reading_token = true;
      m_pending.clear();
    } else if (c == ')') {
      close_entry();
    }
  }

  // A name only continues on the next line when TeX hard-wrapped this one
  bool wrapped = m_max_print_line > 0 && line.text.size() == m_max_print_line;
  if (m_reading_token && !wrapped) {
    finish_token();
  }
}

void file_context_tracker::flush() {
  if (m_reading_token) {
    finish_token();
  }
}

std::optional<std::string> file_context_tracker::current_file() const {
  for (auto it = m_stack.rbegin(); it != m_stack.rend(); ++it) {
    if (!it->empty()) {
      return *it;
    }
  }
  return std::nullopt;
}

std::vector<std::string> file_context_tracker::open_files() const {
  std::vector<std::string> files;
  for (const auto &entry : m_stack) {
    if (!entry.empty()) {
      files.push_back(entry);
    }
  }
  return files;
}

void file_context_tracker::reset() {
  m_stack.clear();
  m_pending.clear();
  m_reading_token = false;
  m_quoted = false;
}

bool file_context_tracker::is_filename_token(const std::string &token) {
  if (token.empty()) {
    return false;
  }

  if (token.find('/') != std::string::npos) {
    return true;
  }

  size_t dot = token.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    return false;
  }

  std::string extension = token.substr(dot + 1);
  if (extension.size() < 2 ||
      !std::isalpha(static_cast<unsigned char>(extension[0]))) {
    return false;
  }

  for (char c : extension) {
    if (!std::isalnum(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string file_context_tracker::normalize_filename(const std::string &token) {
  if (token.rfind("./", 0) == 0) {
    return token.substr(2);
  }
  return token;
}

void file_context_tracker::finish_token() {
  if (is_filename_token(m_pending)) {
    m_stack.push_back(normalize_filename(m_pending));
  } else {
    m_stack.emplace_back();
  }
  m_pending.clear();
  m_reading_token = false;
  m_quoted = false;
}

void file_context_tracker::close_entry() {
  // Unbalanced ")" is ignored
  if (!m_stack.empty()) {
    m_stack.pop_back();
  }
}

} // namespace latexerr
