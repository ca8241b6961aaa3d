/**
 * @file toml_reader.cpp
 * @brief Implementation of TOML file parsing utilities
 */

#include "core/toml_reader.hpp"
#include "latexerr/log.hpp"

#include <filesystem>
#include <sstream>

// Include tomlplusplus header
#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

namespace latexerr {

toml_reader::toml_reader() : toml_data(nullptr) {}

toml_reader::~toml_reader() {
  if (toml_data) {
    delete static_cast<toml::table *>(toml_data);
    toml_data = nullptr;
  }
}

bool toml_reader::load(const std::string &filepath) {
  try {
    // If we have existing data, delete it
    if (toml_data) {
      delete static_cast<toml::table *>(toml_data);
      toml_data = nullptr;
    }

    if (!std::filesystem::exists(filepath)) {
      logger::print_error("TOML file does not exist: " + filepath);
      return false;
    }

    toml_data = new toml::table(toml::parse_file(filepath));
    return true;
  } catch (const toml::parse_error &err) {
    std::stringstream ss;
    ss << "Error parsing TOML file " << filepath << ": " << err.description()
       << " at line " << err.source().begin.line;
    logger::print_error(ss.str());
    return false;
  } catch (const std::exception &ex) {
    logger::print_error("Error reading TOML file " + filepath + ": " +
                        ex.what());
    return false;
  }
}

std::string toml_reader::get_string(const std::string &key,
                                    const std::string &default_value) const {
  if (!toml_data) {
    return default_value;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  auto value = table.at_path(key);
  if (!value || !value.is_string()) {
    return default_value;
  }
  return value.as_string()->get();
}

int64_t toml_reader::get_int(const std::string &key,
                             int64_t default_value) const {
  if (!toml_data) {
    return default_value;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  auto value = table.at_path(key);
  if (!value || !value.is_integer()) {
    return default_value;
  }
  return value.as_integer()->get();
}

bool toml_reader::get_bool(const std::string &key, bool default_value) const {
  if (!toml_data) {
    return default_value;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  auto value = table.at_path(key);
  if (!value || !value.is_boolean()) {
    return default_value;
  }
  return value.as_boolean()->get();
}

std::vector<std::string>
toml_reader::get_string_array(const std::string &key) const {
  std::vector<std::string> result;
  if (!toml_data) {
    return result;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  auto value = table.at_path(key);
  if (!value || !value.is_array()) {
    return result;
  }

  for (const auto &val : *value.as_array()) {
    if (val.is_string()) {
      result.push_back(val.as_string()->get());
    }
  }
  return result;
}

bool toml_reader::has_key(const std::string &key) const {
  if (!toml_data) {
    return false;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  return static_cast<bool>(table.at_path(key));
}

} // namespace latexerr
