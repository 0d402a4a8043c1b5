/**
 * @file program.hpp
 * @brief The fixed output sequence of the basics program
 */

#ifndef BASICS_PROGRAM_HPP
#define BASICS_PROGRAM_HPP

#include <cstdio>

#include "core/program_config.hpp"
#include "core/types.h"

namespace basics {

/**
 * @brief Values of the two bindings after the increment
 */
struct binding_values {
  basics_long_t x;
  basics_long_t y;
};

/**
 * @brief Create the bindings and apply the increment to the mutable one
 * @param config Literal values
 * @return {x, y + y_increment}
 */
binding_values apply_bindings(const program_config &config);

/**
 * @brief Classify a value against a digit threshold
 * @param value Value to classify
 * @param threshold Strict upper bound for a single digit
 * @return "Single digit" when value < threshold, "Double digit" otherwise
 */
basics_cstring_t classify_digits(basics_long_t value, basics_long_t threshold);

/**
 * @brief Call fn for each value of the inclusive range first..=last
 *
 * Values are visited in ascending order without being stored. Nothing is
 * visited when first > last.
 */
template <typename Fn>
void for_each_in_range(basics_long_t first, basics_long_t last, Fn fn) {
  if (first > last) {
    return;
  }
  // Stop on equality so last == LLONG_MAX cannot overflow
  for (basics_long_t i = first;; ++i) {
    fn(i);
    if (i == last)
      break;
  }
}

/**
 * @brief Write the whole program output
 *
 * Order: greeting, bindings, branch, loop, Greeter call, with a separator
 * line between each section.
 *
 * @param out Destination stream
 * @param config Literal values
 */
void run_program(FILE *out, const program_config &config);

} // namespace basics

#endif // BASICS_PROGRAM_HPP
