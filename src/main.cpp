/**
 * @file main.cpp
 * @brief Main entry point for basics
 */

#include "core/program.hpp"
#include "core/program_config.hpp"

/**
 * @brief Main function
 *
 * Takes no arguments and always runs with the built-in literals.
 *
 * @return int Exit code
 */
int main() {
  basics::run_program(stdout, basics::default_program_config());
  return 0;
}
