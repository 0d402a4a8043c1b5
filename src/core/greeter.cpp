/**
 * @file greeter.cpp
 * @brief Implementation of the greeting line
 */

#include "core/greeter.hpp"

#include <fmt/core.h>

namespace basics {

std::string format_greeting(std::string_view name) {
  return fmt::format("Hello, {}!", name);
}

void greet(FILE *out, std::string_view name) {
  fmt::print(out, "{}\n", format_greeting(name));
}

} // namespace basics
