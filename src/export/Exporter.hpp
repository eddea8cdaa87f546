/**
 * @file Exporter.hpp
 * @brief Per-format exporter contract, COPY capability and sink session
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"
#include "../core/Logger.hpp"
#include "../output/OutputSink.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pgexport {

/**
 * @brief Server-side bulk export stream (COPY ... TO STDOUT)
 */
class CopySource {
public:
    using ChunkHandler = std::function<void(const char* data, std::size_t size)>;

    virtual ~CopySource() = default;

    /**
     * @brief Run a COPY statement and hand every chunk to the handler
     * @return Row count reported by the server
     * @throws DatabaseError if the statement fails
     */
    virtual std::uint64_t copy_to(const std::string& copy_sql, const ChunkHandler& handler) = 0;
};

/**
 * @brief Optional capability: export by delegating to the server's COPY
 */
class CopyCapable {
public:
    virtual ~CopyCapable() = default;

    virtual std::size_t export_copy(CopySource& source,
                                    const std::string& query,
                                    const ExportOptions& options) = 0;
};

/**
 * @brief Renders a cursor into one output format
 *
 * Every implementation opens exactly one sink per call, writes all rows
 * and closes the sink exactly once, on success and on failure alike.
 */
class Exporter {
public:
    virtual ~Exporter() = default;

    /**
     * @brief Export every row of the cursor
     * @return Number of data rows written
     * @throws ConfigurationError before any row is read
     * @throws RowError with the failing 1-based row index
     * @throws CursorError if the cursor reports a terminal fault
     * @throws SinkError on create, write or close failure
     */
    virtual std::size_t export_rows(Cursor& cursor, const ExportOptions& options) = 0;

    /// Capability query; nullptr when the format has no COPY path
    virtual CopyCapable* as_copy_capable() { return nullptr; }

    /// Replace the sink factory (create_sink by default)
    void set_sink_factory(SinkFactory factory) { sink_factory_ = std::move(factory); }

protected:
    std::unique_ptr<OutputSink> open_sink(const ExportOptions& options) const;

private:
    SinkFactory sink_factory_ = create_sink;
};

/**
 * @brief Scoped ownership of the sink for one export call
 *
 * finish() closes the sink and propagates a close failure. If the
 * session is destroyed without finish(), typically while an exception
 * unwinds, the sink is closed best-effort and any close error is logged.
 */
class ExportSession {
public:
    ExportSession(std::unique_ptr<OutputSink> sink, const Logger& logger);
    ~ExportSession();

    ExportSession(const ExportSession&) = delete;
    ExportSession& operator=(const ExportSession&) = delete;

    OutputSink& sink() { return *sink_; }

    void write(std::string_view text) { sink_->write(text); }

    void finish();

private:
    std::unique_ptr<OutputSink> sink_;
    const Logger& logger_;
};

/**
 * @brief Periodic progress reporting for the row loops
 */
class ExportProgress {
public:
    static constexpr std::size_t LOG_INTERVAL_ROWS = 10000;

    explicit ExportProgress(const Logger& logger);

    /**
     * @brief Count one row
     * @return true on every LOG_INTERVAL_ROWS boundary
     */
    bool row_written();

    std::size_t rows() const { return rows_; }

    /// Seconds since construction
    double elapsed_seconds() const;

    /// Rows per second since construction
    double rate() const;

    void log_completed(const std::string& format) const;

private:
    const Logger& logger_;
    std::chrono::steady_clock::time_point start_;
    std::size_t rows_ = 0;
};

/// Column names in descriptor order
std::vector<std::string> column_names(const std::vector<FieldDescriptor>& fields);

/**
 * @brief Fetch the current row's values, wrapping failures as RowError
 * @param row_index 1-based index of the row being read
 */
std::vector<Value> read_row(Cursor& cursor, std::size_t row_index);

/// Throw CursorError if the cursor recorded a terminal fault
void check_cursor(const Cursor& cursor, std::size_t rows_written);

}  // namespace pgexport
