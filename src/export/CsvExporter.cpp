/**
 * @file CsvExporter.cpp
 * @brief Delimited text export with an optional server-side COPY path
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CsvExporter.hpp"
#include "ValueFormatter.hpp"

#include <chrono>

namespace pgexport {

namespace {

constexpr auto FLUSH_INTERVAL = std::chrono::seconds(2);

/// Byte length of the UTF-8 sequence introduced by a lead byte, 0 if invalid
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

bool starts_with_space(const std::string& field) {
    unsigned char c = static_cast<unsigned char>(field[0]);
    if (c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r') {
        return true;
    }
    // U+0085 and U+00A0
    if (c == 0xC2 && field.size() > 1) {
        unsigned char next = static_cast<unsigned char>(field[1]);
        return next == 0x85 || next == 0xA0;
    }
    return false;
}

}  // namespace

std::string resolve_delimiter(const std::string& delimiter) {
    std::string value = delimiter == "\\t" ? std::string("\t") : delimiter;
    if (value.empty()) {
        throw ConfigurationError("delimiter cannot be empty");
    }
    std::size_t length = utf8_sequence_length(static_cast<unsigned char>(value[0]));
    if (length == 0 || length != value.size()) {
        throw ConfigurationError("delimiter must be a single character, got \"" + delimiter + "\"");
    }
    if (value == "\"" || value == "\r" || value == "\n") {
        throw ConfigurationError("invalid delimiter \"" + delimiter + "\"");
    }
    return value;
}

// ============================================================================
// CsvWriter
// ============================================================================

CsvWriter::CsvWriter(OutputSink& sink, std::string delimiter)
    : sink_(sink), delimiter_(std::move(delimiter)) {}

bool CsvWriter::field_needs_quotes(const std::string& field, const std::string& delimiter) {
    if (field.empty()) {
        return false;
    }
    if (field == "\\.") {
        return true;
    }
    if (field.find(delimiter) != std::string::npos ||
        field.find_first_of("\"\r\n") != std::string::npos) {
        return true;
    }
    return starts_with_space(field);
}

void CsvWriter::write_record(const std::vector<std::string>& fields) {
    line_.clear();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            line_ += delimiter_;
        }
        const std::string& field = fields[i];
        if (!field_needs_quotes(field, delimiter_)) {
            line_ += field;
            continue;
        }
        line_.push_back('"');
        for (char c : field) {
            if (c == '"') {
                line_.push_back('"');
            }
            line_.push_back(c);
        }
        line_.push_back('"');
    }
    line_.push_back('\n');
    sink_.write(line_);
}

// ============================================================================
// CsvExporter
// ============================================================================

CsvExporter::CsvExporter()
    : logger_("CsvExporter") {}

std::size_t CsvExporter::export_rows(Cursor& cursor, const ExportOptions& options) {
    std::string delimiter = resolve_delimiter(options.delimiter);

    logger_.debug("Preparing CSV export (delimiter=\"" + delimiter + "\", noHeader=" +
                  (options.no_header ? "true" : "false") + ", compression=" + options.compression + ")");

    ValueFormatter formatter(options.time_format, options.time_zone);
    ExportSession session(open_sink(options), logger_);
    CsvWriter writer(session.sink(), delimiter);

    const auto& fields = cursor.field_descriptors();
    if (!options.no_header) {
        writer.write_record(column_names(fields));
        logger_.debug("CSV headers written: " + std::to_string(fields.size()) + " columns");
    }

    ExportProgress progress(logger_);
    auto last_flush = std::chrono::steady_clock::now();
    std::vector<std::string> record(fields.size());

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        std::vector<Value> values = read_row(cursor, row_index);

        try {
            for (std::size_t i = 0; i < values.size(); ++i) {
                record[i] = formatter.to_csv(values[i], fields[i].wire_type());
            }
            writer.write_record(record);
        } catch (const std::exception& e) {
            throw RowError("error writing row", row_index, e.what());
        }

        bool interval = progress.row_written();
        auto now = std::chrono::steady_clock::now();
        if (interval || now - last_flush > FLUSH_INTERVAL) {
            session.sink().flush();
            last_flush = now;
        }
    }

    check_cursor(cursor, progress.rows());

    logger_.debug("Flushing CSV buffers to disk...");
    session.finish();
    progress.log_completed("CSV");
    return progress.rows();
}

std::string CsvExporter::build_copy_statement(const std::string& query, const ExportOptions& options) {
    std::string delimiter = resolve_delimiter(options.delimiter);
    std::string quoted;
    for (char c : delimiter) {
        if (c == '\'') quoted.push_back('\'');
        quoted.push_back(c);
    }
    return "COPY (" + query + ") TO STDOUT WITH (FORMAT csv, HEADER " +
           (options.no_header ? "false" : "true") + ", DELIMITER '" + quoted + "')";
}

std::size_t CsvExporter::export_copy(CopySource& source,
                                     const std::string& query,
                                     const ExportOptions& options) {
    std::string copy_sql = build_copy_statement(query, options);
    logger_.debug("Starting PostgreSQL COPY export (noHeader=" + std::string(options.no_header ? "true" : "false") +
                  ", compression=" + options.compression + ")");

    ExportProgress progress(logger_);
    ExportSession session(open_sink(options), logger_);

    std::uint64_t rows = 0;
    try {
        rows = source.copy_to(copy_sql, [&session](const char* data, std::size_t size) {
            session.sink().write(data, size);
        });
    } catch (const SinkError&) {
        throw;
    } catch (const std::exception& e) {
        throw DatabaseError(std::string("COPY TO STDOUT failed: ") + e.what());
    }

    session.finish();
    logger_.debug("COPY export completed successfully: " + std::to_string(rows) + " rows written in " +
                  std::to_string(progress.elapsed_seconds()) + "s");
    return static_cast<std::size_t>(rows);
}

}  // namespace pgexport
