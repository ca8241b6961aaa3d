/**
 * @file toml_reader.hpp
 * @brief TOML file parsing utilities using tomlplusplus
 */

#ifndef LATEXERR_TOML_READER_H
#define LATEXERR_TOML_READER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.h"

namespace latexerr {

/**
 * @brief Class for reading and parsing TOML configuration files
 */
class toml_reader {
public:
  /**
   * @brief Constructor
   */
  toml_reader();

  /**
   * @brief Destructor
   */
  ~toml_reader();

  toml_reader(const toml_reader &) = delete;
  toml_reader &operator=(const toml_reader &) = delete;

  /**
   * @brief Load and parse a TOML file
   * @param filepath Path to the TOML file
   * @return True if the file was successfully loaded and parsed
   */
  bool load(const std::string &filepath);

  /**
   * @brief Get a string value from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  std::string get_string(const std::string &key,
                         const std::string &default_value = "") const;

  /**
   * @brief Get an integer value from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  int64_t get_int(const std::string &key, int64_t default_value = 0) const;

  /**
   * @brief Get a boolean value from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  bool get_bool(const std::string &key, bool default_value = false) const;

  /**
   * @brief Get a string array from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @return The array associated with the key, or empty vector if not found
   */
  std::vector<std::string> get_string_array(const std::string &key) const;

  /**
   * @brief Check if a key exists in the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @return True if the key exists
   */
  bool has_key(const std::string &key) const;

private:
  latexerr_pointer_t toml_data; // Opaque pointer to the toml::table
};

} // namespace latexerr

#endif // LATEXERR_TOML_READER_H
