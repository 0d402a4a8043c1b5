/**
 * @file log.cpp
 * @brief Cargo-style logging implementation
 *
 * Output format:
 *   {status:>12} {message}
 *
 * Examples:
 *       Checking basics
 *        warning: missing [program] table
 *          error: cannot parse config
 */

#include "basics/log.hpp"
#include "core/types.h"

#ifdef __cplusplus
namespace basics {

log_verbosity logger::s_verbosity = log_verbosity::VERBOSITY_NORMAL;
FILE *logger::s_stream = nullptr;

void logger::set_verbosity(log_verbosity level) { s_verbosity = level; }

log_verbosity logger::get_verbosity() { return s_verbosity; }

void logger::set_stream(FILE *stream) { s_stream = stream; }


// Core formatting helper


void logger::print_status_line(const std::string &status,
                               const std::string &message,
                               fmt::color status_color, bool is_bold) {
  FILE *stream = s_stream ? s_stream : stderr;
  // Right-align status word to STATUS_WIDTH characters
  if (is_bold) {
    fmt::print(stream, fg(status_color) | fmt::emphasis::bold, "{:>{}}", status,
               STATUS_WIDTH);
  } else {
    fmt::print(stream, fg(status_color), "{:>{}}", status, STATUS_WIDTH);
  }
  fmt::print(stream, " {}\n", message);
}


// Main logging functions


void logger::print_action(const std::string &action,
                          const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line(action, message, fmt::color::green);
}

void logger::print_warning(const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("warning", message, fmt::color::yellow);
}

void logger::print_error(const std::string &message) {
  // Errors always show
  print_status_line("error", message, fmt::color::red);
}

void logger::print_verbose(const std::string &message) {
  if (s_verbosity != log_verbosity::VERBOSITY_VERBOSE)
    return;

  // Gray, non-bold for verbose output
  print_status_line("", message, fmt::color::gray, false);
}

} // namespace basics


// C wrapper implementations

extern "C" {

void basics_set_verbosity_impl(basics_log_verbosity_t level) {
  basics::log_verbosity cpp_level;
  switch (level) {
  case BASICS_VERBOSITY_QUIET:
    cpp_level = basics::log_verbosity::VERBOSITY_QUIET;
    break;
  case BASICS_VERBOSITY_VERBOSE:
    cpp_level = basics::log_verbosity::VERBOSITY_VERBOSE;
    break;
  default:
    cpp_level = basics::log_verbosity::VERBOSITY_NORMAL;
    break;
  }
  basics::logger::set_verbosity(cpp_level);
}

basics_log_verbosity_t basics_get_verbosity(void) {
  auto verb = basics::logger::get_verbosity();
  switch (verb) {
  case basics::log_verbosity::VERBOSITY_QUIET:
    return BASICS_VERBOSITY_QUIET;
  case basics::log_verbosity::VERBOSITY_VERBOSE:
    return BASICS_VERBOSITY_VERBOSE;
  default:
    return BASICS_VERBOSITY_NORMAL;
  }
}

} // extern "C"
#endif // __cplusplus
