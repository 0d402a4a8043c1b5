/**
 * @file test_log.cpp
 * @brief Tests for logger verbosity and routing
 */

#include "test_framework.h"
#include "test_capture.hpp"
#include "basics/log.hpp"

#include <string>

using namespace basics;

TEST(Log, VerbosityRoundTrip) {
    basics_set_verbosity_impl(BASICS_VERBOSITY_VERBOSE);
    bs_assert(logger::get_verbosity() == log_verbosity::VERBOSITY_VERBOSE);
    bs_assert(basics_get_verbosity() == BASICS_VERBOSITY_VERBOSE);

    basics_set_verbosity_impl(BASICS_VERBOSITY_QUIET);
    bs_assert(logger::get_verbosity() == log_verbosity::VERBOSITY_QUIET);

    logger::set_verbosity(log_verbosity::VERBOSITY_NORMAL);
    bs_assert(basics_get_verbosity() == BASICS_VERBOSITY_NORMAL);
    return 0;
}

// Test: errors print even when quiet, warnings do not
TEST(Log, QuietKeepsErrors) {
    logger::set_verbosity(log_verbosity::VERBOSITY_QUIET);
    std::string text = capture_output([](FILE *out) {
        logger::set_stream(out);
        logger::print_warning("hidden warning");
        logger::print_error("shown error");
        logger::set_stream(nullptr);
    });
    logger::set_verbosity(log_verbosity::VERBOSITY_NORMAL);

    bs_assert(text.find("hidden warning") == std::string::npos);
    bs_assert(text.find("shown error") != std::string::npos);
    return 0;
}

TEST(Log, VerboseOnlyWhenVerbose) {
    std::string normal = capture_output([](FILE *out) {
        logger::set_stream(out);
        logger::print_verbose("detail");
        logger::set_stream(nullptr);
    });
    bs_assert(normal.empty());

    logger::set_verbosity(log_verbosity::VERBOSITY_VERBOSE);
    std::string verbose = capture_output([](FILE *out) {
        logger::set_stream(out);
        logger::print_verbose("detail");
        logger::set_stream(nullptr);
    });
    logger::set_verbosity(log_verbosity::VERBOSITY_NORMAL);

    bs_assert(verbose.find("detail") != std::string::npos);
    return 0;
}

// Test: status words are right-aligned to twelve columns
TEST(Log, ActionAlignment) {
    std::string text = capture_output([](FILE *out) {
        logger::set_stream(out);
        logger::print_action("Checking", "basics");
        logger::set_stream(nullptr);
    });
    bs_assert(text.find("    Checking") != std::string::npos);
    bs_assert(text.find(" basics\n") != std::string::npos);
    return 0;
}
