/**
 * @file greeter.hpp
 * @brief Greeting line for a name
 */

#ifndef BASICS_GREETER_HPP
#define BASICS_GREETER_HPP

#include <cstdio>
#include <string>
#include <string_view>

namespace basics {

/**
 * @brief Build the greeting for a name, without the trailing newline
 * @param name Any character sequence, interpolated verbatim
 * @return "Hello, <name>!"
 */
std::string format_greeting(std::string_view name);

/**
 * @brief Write the greeting line for a name
 * @param out Destination stream
 * @param name Any character sequence, interpolated verbatim
 */
void greet(FILE *out, std::string_view name);

} // namespace basics

#endif // BASICS_GREETER_HPP
