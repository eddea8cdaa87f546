/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of export orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "ConfigurationManager.hpp"
#include "../core/QueryValidator.hpp"
#include "../db/PgStore.hpp"
#include "../export/ExporterRegistry.hpp"
#include "../output/OutputSink.hpp"
#include "version.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>

namespace pgexport {

ExportOrchestrator::ExportOrchestrator(const CommandLineConfig& config,
                                       const ExporterRegistry& registry,
                                       StoreFactory store_factory)
    : config_(config)
    , registry_(registry)
    , store_factory_(std::move(store_factory))
    , logger_("ExportOrchestrator")
{
    if (!store_factory_) {
        store_factory_ = [](const std::string& dsn) -> std::unique_ptr<Store> {
            return std::make_unique<PgStore>(dsn);
        };
    }
}

std::size_t ExportOrchestrator::run() {
    auto start_time = std::chrono::steady_clock::now();
    logger_.debug("Version: " + std::string(PGEXPORT_VERSION_STRING));

    std::string query = load_query();
    QueryValidator().validate(query);

    std::string dsn = resolve_dsn();
    auto store = store_factory_(dsn);
    store->connect();

    std::size_t rows = export_with(*store, query);
    store->close();

    SinkConfig sink_config;
    sink_config.path = config_.options.output_path;
    sink_config.compression = config_.options.compression;
    sink_config.format = config_.options.format;
    handle_result(rows, resolve_output_path(sink_config));

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    logger_.debug("Total run time: " + std::to_string(elapsed) + "s");
    return rows;
}

std::string ExportOrchestrator::load_query() const {
    if (config_.sql_file.empty()) {
        logger_.debug("Using inline SQL query (" + std::to_string(config_.sql.size()) + " characters)");
        return config_.sql;
    }

    logger_.debug("Reading SQL from file: " + config_.sql_file);
    std::ifstream file(config_.sql_file, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("error reading SQL file: unable to read file: " + config_.sql_file +
                                 ": " + std::strerror(errno));
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw ConfigurationError("error reading SQL file: unable to read file: " + config_.sql_file);
    }

    std::string query = content.str();
    logger_.debug("SQL query loaded from file (" + std::to_string(query.size()) + " characters)");
    return query;
}

std::string ExportOrchestrator::resolve_dsn() const {
    const auto& connection = config_.connection;
    if (!connection.dsn.empty()) {
        logger_.debug("Using connection string from --dsn flag");
        return connection.dsn;
    }

    logger_.debug("Loading configuration from environment and flags");
    ConfigurationManager env_file;
    if (env_file.load_from_file(".env")) {
        logger_.debug("Loaded " + std::to_string(env_file.size()) + " values from .env");
        env_file.apply_to_environment();
    }

    DatabaseConfig db = DatabaseConfig::from_environment();
    if (!connection.host.empty()) {
        db.host = connection.host;
        logger_.debug("Overriding DB host from flag: " + connection.host);
    }
    if (connection.port) {
        db.port = connection.port.value();
        logger_.debug("Overriding DB port from flag: " + std::to_string(db.port));
    }
    if (!connection.user.empty()) {
        db.user = connection.user;
        logger_.debug("Overriding DB user from flag: " + connection.user);
    }
    if (!connection.database.empty()) {
        db.name = connection.database;
        logger_.debug("Overriding DB name from flag: " + connection.database);
    }
    if (!connection.password.empty()) {
        db.password = connection.password;
        logger_.debug("Overriding DB password from flag (hidden)");
    }

    db.validate();
    logger_.debug("Configuration loaded: host=" + db.host + " port=" + std::to_string(db.port) +
                  " database=" + db.name + " user=" + db.user);
    return db.connection_string();
}

std::size_t ExportOrchestrator::export_with(Store& store, const std::string& query) {
    const auto& options = config_.options;
    auto exporter = registry_.get(options.format);

    try {
        if (config_.with_copy) {
            logger_.debug("Using PostgreSQL COPY mode for fast CSV export");
            CopyCapable* copy = exporter->as_copy_capable();
            if (copy == nullptr) {
                throw ConfigurationError("format " + options.format + " does not support COPY mode");
            }
            return copy->export_copy(store, query, options);
        }

        logger_.debug("Using standard export mode for format: " + options.format);
        auto cursor = store.query(query);
        return exporter->export_rows(*cursor, options);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const ExportError& e) {
        if (e.rows_written() > 0) {
            logger_.warning("Export aborted after " + std::to_string(e.rows_written()) +
                            " rows; the output file is incomplete and must not be used");
        }
        throw;
    }
}

void ExportOrchestrator::handle_result(std::size_t rows, const std::string& output_path) const {
    if (rows == 0) {
        if (config_.fail_on_empty) {
            throw ExportError("export failed: query returned 0 rows");
        }
        logger_.warning("Query returned 0 rows. File created at " + output_path +
                        " but contains no data rows");
        return;
    }
    logger_.info("Export completed: " + std::to_string(rows) + " rows -> " + output_path);
}

} // namespace pgexport
