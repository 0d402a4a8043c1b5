/**
 * @file program.cpp
 * @brief Implementation of the basics program sequence
 */

#include "core/program.hpp"
#include "core/greeter.hpp"

#include <fmt/core.h>

namespace basics {

binding_values apply_bindings(const program_config &config) {
  const basics_long_t x = config.x;
  basics_long_t y = config.y;
  y += config.y_increment;
  return binding_values{x, y};
}

basics_cstring_t classify_digits(basics_long_t value, basics_long_t threshold) {
  if (value < threshold) {
    return "Single digit";
  }
  return "Double digit";
}

void run_program(FILE *out, const program_config &config) {
  fmt::print(out, "Hello, world!\n");
  fmt::print(out, "{}\n", config.separator);

  binding_values bindings = apply_bindings(config);
  fmt::print(out, "x: {}, y: {}\n", bindings.x, bindings.y);
  fmt::print(out, "{}\n", config.separator);

  fmt::print(out, "{}\n", classify_digits(config.number, config.digit_threshold));
  fmt::print(out, "{}\n", config.separator);

  for_each_in_range(config.range_first, config.range_last,
                    [out](basics_long_t i) { fmt::print(out, "Number: {}\n", i); });
  fmt::print(out, "{}\n", config.separator);

  greet(out, config.greet_name);
}

} // namespace basics
