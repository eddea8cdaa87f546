/**
 * @file XlsxExporter.hpp
 * @brief Spreadsheet export with automatic sheet rollover
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Exporter.hpp"

#include <cstdint>

namespace pgexport {

/**
 * @brief Writes rows into Sheet1, Sheet2, ... of an XLSX workbook
 *
 * The workbook is built in constant-memory mode in a temporary file and
 * then copied through the output sink, so compression applies as for
 * every other format. A new sheet is started once the current one holds
 * max_rows rows, header included.
 */
class XlsxExporter : public Exporter {
public:
    static constexpr std::uint32_t MAX_SHEET_ROWS = 1048576;

    /// @throws ConfigurationError if max_rows is 0 or above MAX_SHEET_ROWS
    explicit XlsxExporter(std::uint32_t max_rows = MAX_SHEET_ROWS);

    std::size_t export_rows(Cursor& cursor, const ExportOptions& options) override;

    /// Sheets produced by the last export
    std::size_t sheets_written() const { return sheets_; }

private:
    Logger logger_;
    std::uint32_t max_rows_;
    std::size_t sheets_ = 0;
};

}  // namespace pgexport
