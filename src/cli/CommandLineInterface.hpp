/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for pgexport
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "CommandLineConfig.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/Logger.hpp"
#include <string>
#include <vector>

namespace pgexport {

class ExporterRegistry;

/**
 * @brief Command line interface for parsing arguments and configuring the export
 */
class CommandLineInterface {
public:
    CommandLineInterface();

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return false if help or version information was printed
     * @throws ConfigurationError for unknown options or malformed values
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Apply PGEXPORT_LOG_LEVEL / PGEXPORT_LOG_FILE, then the logging flags
     *
     * Command-line values override the environment.
     */
    void apply_logging() const;

    /**
     * @brief Check the parsed parameters before anything connects
     *
     * Contradictions are reported together; every other problem is
     * reported on its own.
     *
     * @throws ConfigurationError
     */
    void validate_parameters(const ExporterRegistry& registry) const;

    const CommandLineConfig& get_config() const { return config_; }

private:
    CommandLineConfig config_;
    Logger logger_;

    void define_options(SimpleCommandLineParser& parser) const;
    void parse_all_options(const SimpleCommandLineParser& parser);
};

} // namespace pgexport
