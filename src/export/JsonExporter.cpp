/**
 * @file JsonExporter.cpp
 * @brief Streaming JSON array export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "JsonExporter.hpp"
#include "RowEncoders.hpp"

namespace pgexport {

JsonExporter::JsonExporter()
    : logger_("JsonExporter") {}

std::size_t JsonExporter::export_rows(Cursor& cursor, const ExportOptions& options) {
    logger_.debug("Preparing JSON export (indent=2 spaces, compression=" + options.compression + ")");

    ValueFormatter formatter(options.time_format, options.time_zone);
    OrderedJsonEncoder encoder(formatter);
    ExportSession session(open_sink(options), logger_);

    session.write("[\n");

    const auto& fields = cursor.field_descriptors();
    ExportProgress progress(logger_);
    std::string chunk;

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        OrderedRow row(fields, read_row(cursor, row_index));

        try {
            chunk.assign(row_index > 1 ? ",\n  " : "  ");
            chunk += encoder.encode_row(row);
            session.write(chunk);
        } catch (const std::exception& e) {
            throw RowError("error writing row", row_index, e.what());
        }

        progress.row_written();
    }

    check_cursor(cursor, progress.rows());

    session.write("\n]\n");
    session.finish();
    progress.log_completed("JSON");
    return progress.rows();
}

}  // namespace pgexport
