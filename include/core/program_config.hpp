/**
 * @file program_config.hpp
 * @brief Literal values driving the basics program
 */

#ifndef BASICS_PROGRAM_CONFIG_HPP
#define BASICS_PROGRAM_CONFIG_HPP

#include <string>

#include "core/types.h"

namespace basics {

class toml_reader;

/**
 * @brief The fixed literals the program runs with
 *
 * The executable always uses default_program_config(). Other values only
 * come from program_config_from_toml().
 */
struct program_config {
  basics_long_t x = 5;
  basics_long_t y = 10;
  basics_long_t y_increment = 5;
  basics_long_t number = 7;
  basics_long_t digit_threshold = 10;
  basics_long_t range_first = 1;
  basics_long_t range_last = 5;
  std::string greet_name = "Rustacean";
  std::string separator = "--------------";
};

/**
 * @brief Get the configuration the executable runs with
 */
program_config default_program_config();

/**
 * @brief Overlay the keys of a [program] table on the defaults
 *
 * Keys that are missing or hold the wrong type keep their default value.
 *
 * @param reader A reader holding a parsed document
 * @return The resulting configuration
 */
program_config program_config_from_toml(const toml_reader &reader);

} // namespace basics

#endif // BASICS_PROGRAM_CONFIG_HPP
