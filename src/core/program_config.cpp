/**
 * @file program_config.cpp
 * @brief Default literals and TOML overlay for the basics program
 */

#include "core/program_config.hpp"
#include "basics/log.hpp"
#include "core/toml_reader.hpp"

namespace basics {

program_config default_program_config() { return program_config{}; }

program_config program_config_from_toml(const toml_reader &reader) {
  program_config config = default_program_config();

  if (!reader.has_key("program")) {
    logger::print_warning("no [program] table found, using defaults");
    return config;
  }

  config.x = reader.get_int("program.x", config.x);
  config.y = reader.get_int("program.y", config.y);
  config.y_increment = reader.get_int("program.y_increment", config.y_increment);
  config.number = reader.get_int("program.number", config.number);
  config.digit_threshold =
      reader.get_int("program.digit_threshold", config.digit_threshold);
  config.range_first = reader.get_int("program.range_first", config.range_first);
  config.range_last = reader.get_int("program.range_last", config.range_last);
  config.greet_name = reader.get_string("program.greet_name", config.greet_name);
  config.separator = reader.get_string("program.separator", config.separator);

  logger::print_verbose(fmt::format("config: number={} threshold={} name={}",
                                    config.number, config.digit_threshold,
                                    config.greet_name));
  return config;
}

} // namespace basics
