/**
 * @file main.cpp
 * @brief Main entry point for the debris fragment generator
 *
 * Generates one random convex fragment and writes it as STL.
 *
 * Copyright (c) 2025 The DebrisGenerator Authors
 * Licensed under the MIT License.
 */

#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"
#include <iostream>

using namespace debris;

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.exit_code();  // Help shown or parsing failed
    }

    const DebrisConfig& config = cli.get_config();
    if (!Logger::setLogFile(config.log_file)) {
        std::cerr << "Error: Cannot open log file " << config.log_file.value_or("") << "\n";
        return CommandLineInterface::exit_argument_error;
    }

    return cli.run();
}
