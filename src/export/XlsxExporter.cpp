/**
 * @file XlsxExporter.cpp
 * @brief Spreadsheet export with automatic sheet rollover
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "XlsxExporter.hpp"
#include "ValueFormatter.hpp"
#include "../core/TimeLayout.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include <unistd.h>
#include <xlsxwriter.h>

namespace pgexport {

namespace {

constexpr std::size_t COPY_CHUNK = 64 * 1024;

struct WorkbookDeleter {
    void operator()(lxw_workbook* workbook) const { lxw_workbook_free(workbook); }
};

using WorkbookPtr = std::unique_ptr<lxw_workbook, WorkbookDeleter>;

/**
 * @brief Scratch file removed on scope exit
 */
class TempFile {
public:
    TempFile() {
        std::string pattern = (std::filesystem::temp_directory_path() / "pgexport-xlsx-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        int fd = mkstemp(buffer.data());
        if (fd < 0) {
            throw ExportError(std::string("error creating temporary file: ") + std::strerror(errno));
        }
        ::close(fd);
        path_ = buffer.data();
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

void check(lxw_error error, const std::string& context) {
    if (error != LXW_NO_ERROR) {
        throw ExportError(context + ": " + lxw_strerror(error));
    }
}

lxw_datetime to_lxw(const CivilTime& time) {
    lxw_datetime datetime{};
    datetime.year = time.year;
    datetime.month = time.month;
    datetime.day = time.day;
    datetime.hour = time.hour;
    datetime.min = time.minute;
    datetime.sec = time.second + time.microsecond / 1e6;
    return datetime;
}

/// Sheet-level state for the row loop
struct SheetCursor {
    lxw_worksheet* sheet = nullptr;
    lxw_row_t next_row = 0;
};

}  // namespace

XlsxExporter::XlsxExporter(std::uint32_t max_rows)
    : logger_("XlsxExporter"), max_rows_(max_rows) {
    if (max_rows_ == 0 || max_rows_ > MAX_SHEET_ROWS) {
        throw ConfigurationError("sheet row limit must be between 1 and " + std::to_string(MAX_SHEET_ROWS));
    }
}

std::size_t XlsxExporter::export_rows(Cursor& cursor, const ExportOptions& options) {
    if (!options.no_header && max_rows_ < 2) {
        throw ConfigurationError("sheet row limit must leave room for data below the header");
    }

    logger_.debug("Preparing XLSX export (compression=" + options.compression + ")");

    sheets_ = 0;
    ValueFormatter formatter(options.time_format, options.time_zone);
    ExportSession session(open_sink(options), logger_);
    TempFile scratch;

    lxw_workbook_options workbook_options{};
    workbook_options.constant_memory = LXW_TRUE;
    WorkbookPtr workbook(workbook_new_opt(scratch.path().c_str(), &workbook_options));
    if (!workbook) {
        throw ExportError("error creating Excel workbook (" + scratch.path() + ")");
    }

    lxw_format* header_format = workbook_add_format(workbook.get());
    format_set_bold(header_format);

    lxw_format* datetime_format = workbook_add_format(workbook.get());
    format_set_num_format(datetime_format, to_spreadsheet_format(formatter.time_layout()).c_str());

    lxw_format* date_format = workbook_add_format(workbook.get());
    format_set_num_format(date_format, to_spreadsheet_format(formatter.date_layout()).c_str());

    const auto& fields = cursor.field_descriptors();
    std::vector<std::string> columns = column_names(fields);

    auto start_sheet = [&]() {
        std::string name = "Sheet" + std::to_string(sheets_ + 1);
        SheetCursor current;
        current.sheet = workbook_add_worksheet(workbook.get(), name.c_str());
        if (current.sheet == nullptr) {
            throw ExportError("failed to create new sheet " + name);
        }
        ++sheets_;

        if (!options.no_header) {
            for (std::size_t col = 0; col < columns.size(); ++col) {
                check(worksheet_write_string(current.sheet, 0, static_cast<lxw_col_t>(col),
                                             columns[col].c_str(), header_format),
                      "error writing headers");
            }
            current.next_row = 1;
            logger_.debug("XLSX headers written: " + std::to_string(columns.size()) + " columns");
        }
        return current;
    };

    SheetCursor current = start_sheet();
    ExportProgress progress(logger_);

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        std::vector<Value> values = read_row(cursor, row_index);

        try {
            if (current.next_row >= max_rows_) {
                current = start_sheet();
                logger_.debug("Created new sheet Sheet" + std::to_string(sheets_) + " (row limit reached)");
            }

            for (std::size_t col = 0; col < values.size(); ++col) {
                SpreadsheetCell cell = formatter.to_spreadsheet(values[col], fields[col].wire_type());
                auto column = static_cast<lxw_col_t>(col);
                lxw_error error = LXW_NO_ERROR;

                switch (cell.kind) {
                    case SpreadsheetCell::Kind::EMPTY:
                        break;
                    case SpreadsheetCell::Kind::NUMBER:
                        error = worksheet_write_number(current.sheet, current.next_row, column, cell.number, nullptr);
                        break;
                    case SpreadsheetCell::Kind::BOOLEAN:
                        error = worksheet_write_boolean(current.sheet, current.next_row, column,
                                                        cell.boolean ? 1 : 0, nullptr);
                        break;
                    case SpreadsheetCell::Kind::STRING:
                        error = worksheet_write_string(current.sheet, current.next_row, column,
                                                       cell.text.c_str(), nullptr);
                        break;
                    case SpreadsheetCell::Kind::DATETIME: {
                        lxw_datetime datetime = to_lxw(cell.datetime);
                        error = worksheet_write_datetime(current.sheet, current.next_row, column, &datetime,
                                                         cell.date_only ? date_format : datetime_format);
                        break;
                    }
                }
                check(error, "column " + fields[col].name);
            }
        } catch (const std::exception& e) {
            throw RowError("error writing row", row_index, e.what());
        }

        ++current.next_row;
        progress.row_written();
    }

    check_cursor(cursor, progress.rows());

    // workbook_close frees the workbook whether or not it succeeds
    check(workbook_close(workbook.release()), "error writing Excel file");

    std::ifstream input(scratch.path(), std::ios::binary);
    if (!input) {
        throw ExportError("error reading Excel file (" + scratch.path() + ")", progress.rows());
    }
    std::vector<char> buffer(COPY_CHUNK);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = input.gcount();
        if (got > 0) {
            session.sink().write(buffer.data(), static_cast<std::size_t>(got));
        }
    }
    if (input.bad()) {
        throw ExportError("error reading Excel file (" + scratch.path() + ")", progress.rows());
    }

    session.finish();
    logger_.debug("XLSX export completed across " + std::to_string(sheets_) + " sheet(s)");
    progress.log_completed("XLSX");
    return progress.rows();
}

}  // namespace pgexport
