/**
 * @file log.hpp
 * @brief Cargo-style logging utilities for basics
 *
 * Output format matches Rust's Cargo:
 *   - 12-character right-aligned status word (colored)
 *   - Message follows in default color
 *
 * Everything the logger prints goes to stderr. stdout belongs to the
 * program output.
 */

#ifndef BASICS_LOG_HPP
#define BASICS_LOG_HPP

#include "core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @enum basics_log_verbosity_t
 * @brief C-compatible enum for logging verbosity levels
 */
typedef enum {
  BASICS_VERBOSITY_QUIET,  /**< Minimal output, only errors */
  BASICS_VERBOSITY_NORMAL, /**< Standard output level */
  BASICS_VERBOSITY_VERBOSE /**< Detailed output for debugging */
} basics_log_verbosity_t;

// C wrapper functions
void basics_set_verbosity_impl(basics_log_verbosity_t level);
basics_log_verbosity_t basics_get_verbosity(void);

#ifdef __cplusplus
} // extern "C"

#include <cstdio>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string>

namespace basics {

/**
 * @enum log_verbosity
 * @brief C++ enum class for logging verbosity levels
 */
enum class log_verbosity {
  VERBOSITY_QUIET,  /**< Minimal output, only errors */
  VERBOSITY_NORMAL, /**< Standard output level */
  VERBOSITY_VERBOSE /**< Detailed output for debugging */
};

/**
 * @class logger
 * @brief Static class providing Cargo-style logging functionality
 *
 * All output follows Cargo's format:
 *   {status:>12} {message}
 */
class logger {
public:
  /**
   * @brief Sets the global verbosity level for logging
   * @param level The verbosity level to set
   */
  static void set_verbosity(log_verbosity level);

  /**
   * @brief Gets the current verbosity level
   * @return The current verbosity level
   */
  static log_verbosity get_verbosity();

  /**
   * @brief Redirect logger output (stderr by default)
   * @param stream Destination stream, nullptr restores stderr
   */
  static void set_stream(FILE *stream);

  /**
   * @brief Print a status message with custom action word
   *
   * Format: "{action:>12} {message}"
   * Color: Green for the action word
   */
  static void print_action(const std::string &action,
                           const std::string &message);

  /**
   * @brief Print a yellow warning message
   */
  static void print_warning(const std::string &message);

  /**
   * @brief Print a red error message
   */
  static void print_error(const std::string &message);

  /**
   * @brief Print a gray verbose/debug message
   */
  static void print_verbose(const std::string &message);

private:
  static log_verbosity s_verbosity;
  static FILE *s_stream;

  // Status width for right-alignment (Cargo uses 12)
  static constexpr int STATUS_WIDTH = 12;

  static void print_status_line(const std::string &status,
                                const std::string &message,
                                fmt::color status_color, bool is_bold = true);
};

} // namespace basics
#endif

#endif // BASICS_LOG_HPP
