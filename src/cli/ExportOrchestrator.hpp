/**
 * @file ExportOrchestrator.hpp
 * @brief Runs one export from validated command-line settings
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "CommandLineConfig.hpp"
#include "../core/Logger.hpp"
#include "../db/Store.hpp"
#include <string>

namespace pgexport {

class ExporterRegistry;

/**
 * @brief Orchestrates query loading, connection and export
 *
 * Steps, in order:
 * - read the query (inline or file) and check it is read-only
 * - resolve the connection string and connect
 * - look up the exporter for the format
 * - run the COPY path or the row-by-row path
 * - report the row count, failing on an empty result if requested
 */
class ExportOrchestrator {
public:
    /**
     * @param config Parsed and validated command line
     * @param registry Format table, read-only
     * @param store_factory Builds the store for a DSN (PgStore by default)
     */
    ExportOrchestrator(const CommandLineConfig& config,
                       const ExporterRegistry& registry,
                       StoreFactory store_factory = {});

    /**
     * @brief Execute the export
     * @return Number of data rows written
     * @throws ExportError or a subclass on any failure
     */
    std::size_t run();

    /// @throws ConfigurationError "error reading SQL file: ..."
    std::string load_query() const;

    /**
     * @brief --dsn, or the environment with connection flags applied
     * @throws ConfigurationError "configuration error: ..."
     */
    std::string resolve_dsn() const;

    /**
     * @brief Log the outcome
     * @throws ExportError "export failed: query returned 0 rows" with --fail-on-empty
     */
    void handle_result(std::size_t rows, const std::string& output_path) const;

private:
    const CommandLineConfig& config_;
    const ExporterRegistry& registry_;
    StoreFactory store_factory_;
    Logger logger_;

    std::size_t export_with(Store& store, const std::string& query);

    // Disable copy/move since we hold references
    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
};

} // namespace pgexport
