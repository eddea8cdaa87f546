/**
 * @file CommandLineConfig.hpp
 * @brief Settings collected from the command line
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"

#include <optional>
#include <string>

namespace pgexport {

/**
 * @brief Connection flags; each set value overrides the environment
 */
struct ConnectionOverrides {
    std::string dsn;        ///< Bypasses the environment entirely when set
    std::string host;
    std::optional<int> port;
    std::string user;
    std::string database;
    std::string password;
};

struct CommandLineConfig {
    ExportOptions options;
    ConnectionOverrides connection;

    std::string sql;
    std::string sql_file;

    bool with_copy = false;
    bool fail_on_empty = false;
    bool verbose = false;
    bool quiet = false;

    std::string log_level;  ///< Logger::parseLogConfig() syntax
    std::string log_file;
};

}  // namespace pgexport
