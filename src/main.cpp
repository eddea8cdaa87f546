/**
 * @file main.cpp
 * @brief Main entry point for pgexport
 *
 * Streams the result of a read-only PostgreSQL query into a file in one
 * of several formats, with optional compression.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "pgexport.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "export/ExporterRegistry.hpp"
#include <iostream>

using namespace pgexport;

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    Logger logger("pgexport");

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return 0;  // Help or version was shown
        }
        cli.apply_logging();

        // The format table is filled once here and only read afterwards
        ExporterRegistry registry;
        register_builtin_exporters(registry);

        cli.validate_parameters(registry);

        ExportOrchestrator orchestrator(cli.get_config(), registry);
        orchestrator.run();

        logger.flush();
        return 0;

    } catch (const std::exception& e) {
        logger.error(std::string("Error: ") + e.what());
        logger.flush();
        return 1;
    } catch (...) {
        std::cerr << "Error: unknown failure" << std::endl;
        return 1;
    }
}
