/**
 * @file SqlExporter.cpp
 * @brief Batched INSERT statement export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SqlExporter.hpp"
#include "ValueFormatter.hpp"

namespace pgexport {

SqlExporter::SqlExporter()
    : logger_("SqlExporter") {}

std::string SqlExporter::build_insert(const std::string& table,
                                      const std::vector<std::string>& columns,
                                      const std::vector<std::vector<std::string>>& rows) {
    if (rows.empty()) {
        return "";
    }

    std::string statement = "INSERT INTO " + table + " (";
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) statement += ", ";
        statement += columns[i];
    }
    statement += ") VALUES\n";

    for (std::size_t r = 0; r < rows.size(); ++r) {
        statement += "\t(";
        for (std::size_t i = 0; i < rows[r].size(); ++i) {
            if (i > 0) statement += ", ";
            statement += rows[r][i];
        }
        statement += r + 1 == rows.size() ? ");\n" : "),\n";
    }
    return statement;
}

std::size_t SqlExporter::export_rows(Cursor& cursor, const ExportOptions& options) {
    if (options.table_name.empty()) {
        throw ConfigurationError("table name is required for SQL format");
    }
    if (options.rows_per_statement < 1) {
        throw ConfigurationError("rows per statement must be at least 1, got " +
                                 std::to_string(options.rows_per_statement));
    }

    logger_.debug("Preparing SQL export (table=" + options.table_name + ", compression=" + options.compression +
                  ", rows-per-statement=" + std::to_string(options.rows_per_statement) + ")");

    statements_ = 0;
    ValueFormatter formatter(options.time_format, options.time_zone);
    ExportSession session(open_sink(options), logger_);

    const auto& fields = cursor.field_descriptors();
    std::string table = quote_ident(options.table_name);
    std::vector<std::string> columns;
    columns.reserve(fields.size());
    for (const auto& field : fields) {
        columns.push_back(quote_ident(field.name));
    }

    const auto batch_size = static_cast<std::size_t>(options.rows_per_statement);
    std::vector<std::vector<std::string>> batch;
    batch.reserve(batch_size);

    ExportProgress progress(logger_);

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        std::vector<Value> values = read_row(cursor, row_index);

        try {
            std::vector<std::string> record;
            record.reserve(values.size());
            for (std::size_t i = 0; i < values.size(); ++i) {
                record.push_back(formatter.to_sql(values[i], fields[i].wire_type()));
            }
            batch.push_back(std::move(record));

            if (batch.size() == batch_size) {
                session.write(build_insert(table, columns, batch));
                ++statements_;
                batch.clear();
            }
        } catch (const std::exception& e) {
            throw RowError("error writing row", row_index, e.what());
        }

        progress.row_written();
    }

    check_cursor(cursor, progress.rows());

    if (!batch.empty()) {
        session.write(build_insert(table, columns, batch));
        ++statements_;
    }

    session.finish();
    logger_.debug(std::to_string(statements_) + " INSERT statements written");
    progress.log_completed("SQL");
    return progress.rows();
}

}  // namespace pgexport
