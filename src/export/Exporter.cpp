/**
 * @file Exporter.cpp
 * @brief Shared plumbing for the per-format exporters
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Exporter.hpp"

#include <cstdio>

namespace pgexport {

std::unique_ptr<OutputSink> Exporter::open_sink(const ExportOptions& options) const {
    SinkConfig config;
    config.path = options.output_path;
    config.compression = options.compression;
    config.format = options.format;
    return sink_factory_(config);
}

// ============================================================================
// ExportSession
// ============================================================================

ExportSession::ExportSession(std::unique_ptr<OutputSink> sink, const Logger& logger)
    : sink_(std::move(sink)), logger_(logger) {
    if (!sink_) {
        throw ExportError("no output sink available");
    }
}

ExportSession::~ExportSession() {
    if (sink_->is_closed()) {
        return;
    }
    try {
        sink_->close();
    } catch (const std::exception& e) {
        logger_.warning(std::string("Error closing output after failure: ") + e.what());
    }
}

void ExportSession::finish() {
    sink_->close();
}

// ============================================================================
// ExportProgress
// ============================================================================

ExportProgress::ExportProgress(const Logger& logger)
    : logger_(logger), start_(std::chrono::steady_clock::now()) {}

bool ExportProgress::row_written() {
    ++rows_;
    if (rows_ % LOG_INTERVAL_ROWS != 0) {
        return false;
    }
    if (logger_.shouldOutput(LogLevel::DEBUG)) {
        char buffer[96];
        std::snprintf(buffer, sizeof(buffer), "%zu rows written (%.0f rows/s, elapsed %.1fs)",
                      rows_, rate(), elapsed_seconds());
        logger_.debug(buffer);
    }
    return true;
}

double ExportProgress::elapsed_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

double ExportProgress::rate() const {
    double elapsed = elapsed_seconds();
    return elapsed > 0.0 ? static_cast<double>(rows_) / elapsed : 0.0;
}

void ExportProgress::log_completed(const std::string& format) const {
    if (!logger_.shouldOutput(LogLevel::DEBUG)) {
        return;
    }
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), " export completed: %zu rows written in %.3fs (%.0f rows/s)",
                  rows_, elapsed_seconds(), rate());
    logger_.debug(format + buffer);
}

// ============================================================================
// Row helpers
// ============================================================================

std::vector<std::string> column_names(const std::vector<FieldDescriptor>& fields) {
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto& field : fields) {
        names.push_back(field.name);
    }
    return names;
}

std::vector<Value> read_row(Cursor& cursor, std::size_t row_index) {
    std::vector<Value> values;
    try {
        values = cursor.values();
    } catch (const std::exception& e) {
        throw RowError("error reading row", row_index, e.what());
    }

    std::size_t expected = cursor.field_descriptors().size();
    if (values.size() != expected) {
        throw RowError("error reading row", row_index,
                       "expected " + std::to_string(expected) + " values, got " +
                       std::to_string(values.size()));
    }
    return values;
}

void check_cursor(const Cursor& cursor, std::size_t rows_written) {
    if (auto error = cursor.error()) {
        throw CursorError(*error, rows_written);
    }
}

}  // namespace pgexport
