#pragma once

/**
 * @file pgexport.hpp
 * @brief Main header for the pgexport streaming export pipeline
 *
 * Shared data model for every stage of an export: the options snapshot,
 * column descriptors, the decoded value union, the cursor contract and
 * the error hierarchy.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgexport {

using json = nlohmann::json;

// ============================================================================
// Format and compression names
// ============================================================================

inline constexpr const char* FORMAT_CSV = "csv";
inline constexpr const char* FORMAT_JSON = "json";
inline constexpr const char* FORMAT_XML = "xml";
inline constexpr const char* FORMAT_YAML = "yaml";
inline constexpr const char* FORMAT_SQL = "sql";
inline constexpr const char* FORMAT_XLSX = "xlsx";
inline constexpr const char* FORMAT_TEMPLATE = "template";

inline constexpr const char* COMPRESSION_NONE = "none";
inline constexpr const char* COMPRESSION_GZIP = "gzip";
inline constexpr const char* COMPRESSION_ZIP = "zip";
inline constexpr const char* COMPRESSION_ZSTD = "zstd";
inline constexpr const char* COMPRESSION_LZ4 = "lz4";

inline constexpr const char* DEFAULT_TIME_FORMAT = "yyyy-MM-dd HH:mm:ss";

/**
 * @brief Configuration snapshot for a single export call
 *
 * Built once by the command-line layer and treated as read-only by
 * every exporter.
 */
struct ExportOptions {
    std::string format = FORMAT_CSV;
    std::string output_path;
    std::string compression = COMPRESSION_NONE;

    // CSV
    std::string delimiter = ",";        ///< One UTF-8 encoded character
    bool no_header = false;

    // Time rendering
    std::string time_format = DEFAULT_TIME_FORMAT;
    std::string time_zone;              ///< IANA name, empty for local time

    // XML
    std::string xml_root_element = "results";
    std::string xml_row_element = "row";

    // SQL
    std::string table_name;
    int rows_per_statement = 1;

    // Template
    std::string template_file;
    std::string template_header;
    std::string template_row;
    std::string template_footer;
    bool template_streaming = false;
};

// ============================================================================
// Wire types and decoded values
// ============================================================================

/**
 * @brief PostgreSQL type OIDs the driver layer knows how to decode
 */
namespace oid {
constexpr std::uint32_t BOOL = 16;
constexpr std::uint32_t BYTEA = 17;
constexpr std::uint32_t NAME = 19;
constexpr std::uint32_t INT8 = 20;
constexpr std::uint32_t INT2 = 21;
constexpr std::uint32_t INT4 = 23;
constexpr std::uint32_t TEXT = 25;
constexpr std::uint32_t OID = 26;
constexpr std::uint32_t JSON = 114;
constexpr std::uint32_t FLOAT4 = 700;
constexpr std::uint32_t FLOAT8 = 701;
constexpr std::uint32_t BPCHAR = 1042;
constexpr std::uint32_t VARCHAR = 1043;
constexpr std::uint32_t DATE = 1082;
constexpr std::uint32_t TIME = 1083;
constexpr std::uint32_t TIMESTAMP = 1114;
constexpr std::uint32_t TIMESTAMPTZ = 1184;
constexpr std::uint32_t INTERVAL = 1186;
constexpr std::uint32_t NUMERIC = 1700;
constexpr std::uint32_t UUID = 2950;
constexpr std::uint32_t JSONB = 3802;

constexpr std::uint32_t BOOL_ARRAY = 1000;
constexpr std::uint32_t INT2_ARRAY = 1005;
constexpr std::uint32_t INT4_ARRAY = 1007;
constexpr std::uint32_t TEXT_ARRAY = 1009;
constexpr std::uint32_t BPCHAR_ARRAY = 1014;
constexpr std::uint32_t VARCHAR_ARRAY = 1015;
constexpr std::uint32_t INT8_ARRAY = 1016;
constexpr std::uint32_t FLOAT4_ARRAY = 1021;
constexpr std::uint32_t FLOAT8_ARRAY = 1022;
constexpr std::uint32_t NUMERIC_ARRAY = 1231;
constexpr std::uint32_t UUID_ARRAY = 2951;
}  // namespace oid

/**
 * @brief Closed set of wire types that drive formatting decisions
 *
 * Every OID maps to exactly one variant. PASSTHROUGH covers all types
 * whose decoded value is rendered as-is.
 */
enum class WireType {
    DATE,
    TIMESTAMP,
    TIMESTAMPTZ,
    NUMERIC,
    UUID,
    BYTEA,
    INTERVAL,
    JSON,
    JSONB,
    BOOL,
    PASSTHROUGH
};

constexpr std::size_t WIRE_TYPE_COUNT = static_cast<std::size_t>(WireType::PASSTHROUGH) + 1;

WireType classify_oid(std::uint32_t type_oid);

/**
 * @brief One projected column: name plus wire type identifier
 */
struct FieldDescriptor {
    std::string name;
    std::uint32_t type_oid = oid::TEXT;

    WireType wire_type() const { return classify_oid(type_oid); }
};

/**
 * @brief Calendar date and wall-clock time without zone information
 */
struct CivilTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;

    bool operator==(const CivilTime&) const = default;
};

/**
 * @brief Absolute point in time as microseconds since the Unix epoch
 */
struct Instant {
    std::int64_t micros = 0;

    bool operator==(const Instant&) const = default;
};

struct Uuid {
    std::array<std::uint8_t, 16> bytes{};

    bool operator==(const Uuid&) const = default;
};

/// Arbitrary precision decimal in the server's text form
struct Numeric {
    std::string text;

    bool operator==(const Numeric&) const = default;
};

/// Interval in the server's text form
struct Interval {
    std::string text;

    bool operator==(const Interval&) const = default;
};

/// One-dimensional array whose elements are already JSON scalars
struct ArrayValue {
    json elements = json::array();

    bool operator==(const ArrayValue&) const = default;
};

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief A decoded column value
 *
 * std::monostate is SQL NULL. The json alternative holds JSON/JSONB
 * documents.
 */
using Value = std::variant<std::monostate,
                           bool,
                           std::int64_t,
                           double,
                           std::string,
                           Bytes,
                           CivilTime,
                           Instant,
                           Uuid,
                           Numeric,
                           Interval,
                           json,
                           ArrayValue>;

inline bool is_null(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

// ============================================================================
// Cursor contract
// ============================================================================

/**
 * @brief Forward-only, single-pass iterator over query result rows
 */
class Cursor {
public:
    virtual ~Cursor() = default;

    /// Column descriptors, stable for the life of the cursor
    virtual const std::vector<FieldDescriptor>& field_descriptors() const = 0;

    /// Advance to the next row; false once exhausted or failed
    virtual bool has_next() = 0;

    /// Decoded values of the current row, aligned with field_descriptors()
    virtual std::vector<Value> values() = 0;

    /// Terminal error recorded during iteration, if any
    virtual std::optional<std::string> error() const = 0;
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Base class for every failure surfaced by the pipeline
 */
class ExportError : public std::runtime_error {
public:
    explicit ExportError(const std::string& message, std::size_t rows_written = 0)
        : std::runtime_error(message), rows_written_(rows_written) {}

    std::size_t rows_written() const { return rows_written_; }

private:
    std::size_t rows_written_;
};

/// Invalid or missing option, raised before any row is processed
class ConfigurationError : public ExportError {
public:
    explicit ConfigurationError(const std::string& message)
        : ExportError(message) {}
};

/// Create, write or close failure on the output sink
class SinkError : public ExportError {
public:
    SinkError(const std::string& message, const std::string& path)
        : ExportError(message + " (" + path + ")"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Fetch or encode failure attached to a 1-based row index
class RowError : public ExportError {
public:
    RowError(const std::string& action, std::size_t row_index, const std::string& cause)
        : ExportError(action + " " + std::to_string(row_index) + ": " + cause, row_index - 1),
          row_index_(row_index) {}

    std::size_t row_index() const { return row_index_; }

private:
    std::size_t row_index_;
};

/// Fault reported by the cursor after iteration stopped
class CursorError : public ExportError {
public:
    CursorError(const std::string& cause, std::size_t rows_written)
        : ExportError("error iterating rows: " + cause, rows_written) {}
};

/// Connection, query or COPY failure reported by the database driver
class DatabaseError : public ExportError {
public:
    explicit DatabaseError(const std::string& message, std::size_t rows_written = 0)
        : ExportError(message, rows_written) {}
};

/// Query rejected by the read-only safety check
class QueryValidationError : public ExportError {
public:
    explicit QueryValidationError(const std::string& message)
        : ExportError(message) {}
};

/// Template read, parse or render failure
class TemplateError : public ExportError {
public:
    explicit TemplateError(const std::string& message, std::size_t rows_written = 0)
        : ExportError(message, rows_written) {}
};

}  // namespace pgexport
