#pragma once

/**
 * @file ValueFormatter.hpp
 * @brief Type-driven conversion of decoded values into per-format representations
 *
 * Every exporter funnels its values through one ValueFormatter. Dispatch
 * is keyed by WireType: a base conversion shared by all targets (dates to
 * layout strings, UUIDs to hex, numerics to doubles, ...) followed by the
 * target-specific rules for delimited text, markup, JSON/YAML nodes, SQL
 * literals, spreadsheet cells and template data.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "pgexport.hpp"
#include "core/TimeLayout.hpp"

#include <memory>
#include <string>

namespace pgexport {

/**
 * @brief Content of a single spreadsheet cell
 */
struct SpreadsheetCell {
    enum class Kind { EMPTY, NUMBER, BOOLEAN, STRING, DATETIME };

    Kind kind = Kind::EMPTY;
    double number = 0.0;
    bool boolean = false;
    std::string text;
    CivilTime datetime;
    bool date_only = false;
};

class Logger;

class ValueFormatter {
public:
    /**
     * @brief Constructor
     *
     * An empty or unknown zone falls back to local time; an unknown name
     * is reported once as a warning.
     *
     * @param time_format User layout (yyyy, MM, dd, HH, mm, ss, SSS, SS, S)
     * @param time_zone IANA zone name, empty for local time
     */
    ValueFormatter(const std::string& time_format, const std::string& time_zone);
    ~ValueFormatter();

    ValueFormatter(const ValueFormatter&) = delete;
    ValueFormatter& operator=(const ValueFormatter&) = delete;

    /**
     * @brief Base conversion shared by every target
     *
     * DATE/TIMESTAMP/TIMESTAMPTZ become layout strings, UUID and BYTEA
     * become strings, NUMERIC becomes a double (NULL when unparsable),
     * INTERVAL becomes its text form. JSON and everything else pass through.
     */
    Value normalize(const Value& value, WireType type) const;

    /// Delimited text; NULL is ""
    std::string to_csv(const Value& value, WireType type) const;

    /// Element text content before escaping; NULL is ""
    std::string to_xml(const Value& value, WireType type) const;

    /// Structural node for JSON and YAML output; NULL is null
    json to_json(const Value& value, WireType type) const;

    /// SQL literal; NULL is bare NULL
    std::string to_sql(const Value& value, WireType type) const;

    /// Spreadsheet cell; temporal values stay native
    SpreadsheetCell to_spreadsheet(const Value& value, WireType type) const;

    /// Template data; JSON documents and arrays become JSON text
    json to_template(const Value& value, WireType type) const;

    const std::string& time_layout() const { return layout_; }
    const std::string& date_layout() const { return date_layout_; }

    /// Effective zone ("" means local time)
    const std::string& time_zone() const { return zone_; }

private:
    std::string layout_;
    std::string date_layout_;
    std::string zone_;
    ZoneConverter zone_converter_;
    std::unique_ptr<Logger> logger_;

    std::string json_text(const json& document, const char* fallback) const;
};

// ============================================================================
// Free helpers
// ============================================================================

/// Classic "%.15g" rendering; non-finite values use the PostgreSQL spellings NaN, Infinity and -Infinity
std::string format_float(double value);

/// Lower-case hex grouped 8-4-4-4-12
std::string format_uuid(const Uuid& uuid);

/// Quote an identifier per dot-separated segment: a.b -> "a"."b"
std::string quote_ident(const std::string& identifier);

/// Single-quoted SQL string literal with embedded quotes doubled
std::string quote_literal(const std::string& text);

/// Array in brace notation: {a,b,c}; empty arrays render as {}
std::string format_array(const ArrayValue& array);

}  // namespace pgexport
