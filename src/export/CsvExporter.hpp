/**
 * @file CsvExporter.hpp
 * @brief Delimited text export with an optional server-side COPY path
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Exporter.hpp"

#include <string>
#include <vector>

namespace pgexport {

/**
 * @brief Record writer with RFC 4180 style quoting
 *
 * A field is quoted when it contains the delimiter, a double quote, CR
 * or LF, when it starts with a space, or when it is exactly "\.".
 * Empty fields are never quoted. Records end with "\n".
 */
class CsvWriter {
public:
    CsvWriter(OutputSink& sink, std::string delimiter);

    void write_record(const std::vector<std::string>& fields);

    static bool field_needs_quotes(const std::string& field, const std::string& delimiter);

private:
    OutputSink& sink_;
    std::string delimiter_;
    std::string line_;
};

class CsvExporter : public Exporter, public CopyCapable {
public:
    CsvExporter();

    std::size_t export_rows(Cursor& cursor, const ExportOptions& options) override;

    CopyCapable* as_copy_capable() override { return this; }

    /**
     * @brief Stream "COPY (query) TO STDOUT WITH (FORMAT csv ...)" into the sink
     *
     * Time format and zone options do not apply; the server renders values.
     *
     * @return Row count reported by the server
     */
    std::size_t export_copy(CopySource& source,
                            const std::string& query,
                            const ExportOptions& options) override;

    /// COPY statement for a query, header flag and delimiter
    static std::string build_copy_statement(const std::string& query, const ExportOptions& options);

private:
    Logger logger_;
};

/**
 * @brief Validate and decode the delimiter option
 *
 * "\t" (backslash, t) becomes a tab. Anything other than exactly one
 * UTF-8 encoded character is rejected.
 *
 * @throws ConfigurationError
 */
std::string resolve_delimiter(const std::string& delimiter);

}  // namespace pgexport
