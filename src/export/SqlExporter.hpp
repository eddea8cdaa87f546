/**
 * @file SqlExporter.hpp
 * @brief Batched INSERT statement export
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
 * @brief Groups rows into multi-row INSERT statements
 *
 * For N rows and a batch size B the output holds ceil(N/B) statements:
 *
 *   INSERT INTO "public"."users" ("id", "name") VALUES
 *   	(1, 'a'),
 *   	(2, 'b');
 */
class SqlExporter : public Exporter {
public:
    SqlExporter();

    std::size_t export_rows(Cursor& cursor, const ExportOptions& options) override;

    /// Statements written by the last export
    std::size_t statements_written() const { return statements_; }

    /**
     * @brief Render one INSERT statement
     * @param table Already quoted table name
     * @param columns Already quoted column names
     * @param rows Rendered SQL literals per row
     */
    static std::string build_insert(const std::string& table,
                                    const std::vector<std::string>& columns,
                                    const std::vector<std::vector<std::string>>& rows);

private:
    Logger logger_;
    std::size_t statements_ = 0;
};

}  // namespace pgexport
