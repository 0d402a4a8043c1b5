/**
 * @file toml_reader.hpp
 * @brief TOML parsing utilities using tomlplusplus
 */

#ifndef BASICS_TOML_READER_H
#define BASICS_TOML_READER_H

#include <cstdint>
#include <string>

#include "core/types.h"

namespace basics {

/**
 * @brief Class for reading and parsing TOML configuration documents
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
   * @brief Parse a TOML document held in memory
   * @param content The TOML text
   * @param source_name Name used in diagnostics
   * @return True if the document was successfully parsed
   */
  bool parse(const std::string &content,
             const std::string &source_name = "<memory>");

  /**
   * @brief Get a string value
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  std::string get_string(const std::string &key,
                         const std::string &default_value = "") const;

  /**
   * @brief Get an integer value
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  int64_t get_int(const std::string &key, int64_t default_value = 0) const;

  /**
   * @brief Check if a key exists
   * @param key The key to look up (can be dotted for tables)
   * @return True if the key exists
   */
  bool has_key(const std::string &key) const;

  /**
   * @brief Whether a document is currently loaded
   */
  bool is_loaded() const { return toml_data != nullptr; }

private:
  void reset();

  basics_pointer_t toml_data; // Opaque pointer to the toml::table
};

} // namespace basics

#endif // BASICS_TOML_READER_H
