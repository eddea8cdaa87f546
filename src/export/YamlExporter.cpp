/**
 * @file YamlExporter.cpp
 * @brief YAML sequence-of-mappings export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "YamlExporter.hpp"
#include "RowEncoders.hpp"

namespace pgexport {

YamlExporter::YamlExporter()
    : logger_("YamlExporter") {}

std::size_t YamlExporter::export_rows(Cursor& cursor, const ExportOptions& options) {
    logger_.debug("Preparing YAML export (compression=" + options.compression + ")");

    ValueFormatter formatter(options.time_format, options.time_zone);
    OrderedYamlEncoder encoder(formatter);
    ExportSession session(open_sink(options), logger_);

    const auto& fields = cursor.field_descriptors();
    ExportProgress progress(logger_);

    YAML::Emitter emitter;
    emitter.SetIndent(2);
    emitter.SetNullFormat(YAML::LowerNull);
    emitter << YAML::BeginSeq;

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        std::vector<Value> values = read_row(cursor, row_index);

        try {
            OrderedRow row(fields, std::move(values));
            encoder.encode_row(emitter, row);
        } catch (const std::exception& e) {
            throw RowError("error encoding YAML row", row_index, e.what());
        }

        progress.row_written();
    }

    check_cursor(cursor, progress.rows());

    logger_.debug("Writing YAML document (" + std::to_string(progress.rows()) + " rows)");

    emitter << YAML::EndSeq;
    if (!emitter.good()) {
        throw ExportError("error writing YAML: " + emitter.GetLastError(), progress.rows());
    }

    session.write(emitter.c_str());
    session.write("\n");
    session.finish();
    progress.log_completed("YAML");
    return progress.rows();
}

}  // namespace pgexport
