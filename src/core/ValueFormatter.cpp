/**
 * @file ValueFormatter.cpp
 * @brief Wire-type dispatch table and per-target value rendering
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ValueFormatter.hpp"
#include "Logger.hpp"
#include "TimeLayout.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace pgexport {

WireType classify_oid(std::uint32_t type_oid) {
    switch (type_oid) {
        case oid::DATE: return WireType::DATE;
        case oid::TIMESTAMP: return WireType::TIMESTAMP;
        case oid::TIMESTAMPTZ: return WireType::TIMESTAMPTZ;
        case oid::NUMERIC: return WireType::NUMERIC;
        case oid::UUID: return WireType::UUID;
        case oid::BYTEA: return WireType::BYTEA;
        case oid::INTERVAL: return WireType::INTERVAL;
        case oid::JSON: return WireType::JSON;
        case oid::JSONB: return WireType::JSONB;
        case oid::BOOL: return WireType::BOOL;
        default: return WireType::PASSTHROUGH;
    }
}

namespace {

struct TimeContext {
    const std::string& layout;
    const std::string& date_layout;
    const ZoneConverter& zone;
};

using Normalizer = Value (*)(const Value&, const TimeContext&);

Value passthrough(const Value& value, const TimeContext&) {
    return value;
}

Value normalize_date(const Value& value, const TimeContext& ctx) {
    if (const auto* civil = std::get_if<CivilTime>(&value)) {
        return format_time(*civil, ctx.date_layout);
    }
    return value;
}

Value normalize_timestamp(const Value& value, const TimeContext& ctx) {
    if (const auto* civil = std::get_if<CivilTime>(&value)) {
        return format_time(*civil, ctx.layout);
    }
    return value;
}

Value normalize_timestamptz(const Value& value, const TimeContext& ctx) {
    if (const auto* instant = std::get_if<Instant>(&value)) {
        return format_time(ctx.zone.convert(*instant), ctx.layout);
    }
    if (const auto* civil = std::get_if<CivilTime>(&value)) {
        return format_time(*civil, ctx.layout);
    }
    return value;
}

Value parse_numeric(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (text.empty() || end == begin || *end != '\0') {
        return std::monostate{};
    }
    return parsed;
}

Value normalize_numeric(const Value& value, const TimeContext&) {
    if (const auto* numeric = std::get_if<Numeric>(&value)) {
        return parse_numeric(numeric->text);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return parse_numeric(*text);
    }
    return value;
}

Value normalize_uuid(const Value& value, const TimeContext&) {
    if (const auto* uuid = std::get_if<Uuid>(&value)) {
        return format_uuid(*uuid);
    }
    return value;
}

Value normalize_bytea(const Value& value, const TimeContext&) {
    if (const auto* bytes = std::get_if<Bytes>(&value)) {
        return std::string(bytes->begin(), bytes->end());
    }
    return value;
}

Value normalize_interval(const Value& value, const TimeContext&) {
    if (const auto* interval = std::get_if<Interval>(&value)) {
        return interval->text;
    }
    return value;
}

// Indexed by WireType; order must follow the enum declaration.
constexpr std::array<Normalizer, WIRE_TYPE_COUNT> NORMALIZERS = {
    normalize_date,         // DATE
    normalize_timestamp,    // TIMESTAMP
    normalize_timestamptz,  // TIMESTAMPTZ
    normalize_numeric,      // NUMERIC
    normalize_uuid,         // UUID
    normalize_bytea,        // BYTEA
    normalize_interval,     // INTERVAL
    passthrough,            // JSON
    passthrough,            // JSONB
    passthrough,            // BOOL
    passthrough,            // PASSTHROUGH
};

bool is_json_type(WireType type) {
    return type == WireType::JSON || type == WireType::JSONB;
}

bool needs_array_quotes(const std::string& element) {
    if (element.empty()) return true;
    if (element.size() == 4 && std::toupper(static_cast<unsigned char>(element[0])) == 'N' &&
        std::toupper(static_cast<unsigned char>(element[1])) == 'U' &&
        std::toupper(static_cast<unsigned char>(element[2])) == 'L' &&
        std::toupper(static_cast<unsigned char>(element[3])) == 'L') {
        return true;
    }
    for (unsigned char c : element) {
        if (c == '{' || c == '}' || c == ',' || c == '"' || c == '\\' || std::isspace(c)) {
            return true;
        }
    }
    return false;
}

std::string array_element_text(const json& element) {
    switch (element.type()) {
        case json::value_t::null:
            return "NULL";
        case json::value_t::boolean:
            return element.get<bool>() ? "true" : "false";
        case json::value_t::number_float:
            return format_float(element.get<double>());
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return element.dump();
        default:
            break;
    }

    std::string text = element.is_string()
        ? element.get<std::string>()
        : element.dump(-1, ' ', false, json::error_handler_t::replace);
    if (!needs_array_quotes(text)) {
        return text;
    }

    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') quoted.push_back('\\');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string sql_float(double value, const char* cast) {
    if (std::isnan(value)) return std::string("'NaN'::") + cast;
    if (std::isinf(value)) return std::string(value > 0 ? "'Infinity'::" : "'-Infinity'::") + cast;
    return format_float(value);
}

std::string offset_suffix(int offset_seconds) {
    char sign = offset_seconds < 0 ? '-' : '+';
    int magnitude = offset_seconds < 0 ? -offset_seconds : offset_seconds;
    char buffer[16];
    if (magnitude % 3600 == 0) {
        std::snprintf(buffer, sizeof(buffer), "%c%02d", sign, magnitude / 3600);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%c%02d:%02d", sign, magnitude / 3600, (magnitude % 3600) / 60);
    }
    return buffer;
}

/// Scalar rendering for values that reach a text target untouched
std::string plain_text(const Value& value, const std::string& layout) {
    struct Visitor {
        const std::string& layout;

        std::string operator()(std::monostate) const { return ""; }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(std::int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const { return format_float(v); }
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(const Bytes& v) const { return std::string(v.begin(), v.end()); }
        std::string operator()(const CivilTime& v) const { return format_time(v, layout); }
        std::string operator()(const Instant& v) const { return format_time(civil_from_instant(v), layout); }
        std::string operator()(const Uuid& v) const { return format_uuid(v); }
        std::string operator()(const Numeric& v) const { return v.text; }
        std::string operator()(const Interval& v) const { return v.text; }
        std::string operator()(const json& v) const { return v.dump(-1, ' ', false, json::error_handler_t::replace); }
        std::string operator()(const ArrayValue& v) const { return format_array(v); }
    };
    return std::visit(Visitor{layout}, value);
}

}  // namespace

// ============================================================================
// Free helpers
// ============================================================================

std::string format_float(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.15g", value);
    return buffer;
}

std::string format_uuid(const Uuid& uuid) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < uuid.bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[uuid.bytes[i] >> 4]);
        out.push_back(hex[uuid.bytes[i] & 0x0F]);
    }
    return out;
}

std::string quote_ident(const std::string& identifier) {
    std::string out;
    size_t start = 0;
    while (true) {
        size_t dot = identifier.find('.', start);
        std::string part = identifier.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        out.push_back('"');
        for (char c : part) {
            if (c == '"') out.push_back('"');
            out.push_back(c);
        }
        out.push_back('"');

        if (dot == std::string::npos) break;
        out.push_back('.');
        start = dot + 1;
    }
    return out;
}

std::string quote_literal(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string format_array(const ArrayValue& array) {
    if (!array.elements.is_array() || array.elements.empty()) {
        return "{}";
    }
    std::string out = "{";
    bool first = true;
    for (const auto& element : array.elements) {
        if (!first) out.push_back(',');
        out += array_element_text(element);
        first = false;
    }
    out.push_back('}');
    return out;
}

// ============================================================================
// ValueFormatter
// ============================================================================

ValueFormatter::ValueFormatter(const std::string& time_format, const std::string& time_zone)
    : layout_(time_format.empty() ? std::string(DEFAULT_TIME_FORMAT) : time_format)
    , date_layout_(extract_date_layout(layout_))
    , logger_(std::make_unique<Logger>("ValueFormatter"))
{
    if (!time_zone.empty()) {
        if (is_valid_time_zone(time_zone)) {
            zone_ = time_zone;
        } else {
            logger_->warning("Invalid timezone \"" + time_zone + "\", using local time");
        }
    }
    zone_converter_ = ZoneConverter(zone_);
    logger_->trace("Time layout \"" + layout_ + "\", date layout \"" + date_layout_ +
                   "\", zone \"" + (zone_.empty() ? "Local" : zone_) + "\"");
}

ValueFormatter::~ValueFormatter() = default;

Value ValueFormatter::normalize(const Value& value, WireType type) const {
    if (is_null(value)) {
        return value;
    }
    TimeContext ctx{layout_, date_layout_, zone_converter_};
    return NORMALIZERS[static_cast<size_t>(type)](value, ctx);
}

std::string ValueFormatter::json_text(const json& document, const char* fallback) const {
    try {
        return document.dump();
    } catch (const json::exception& e) {
        logger_->warning(std::string("JSON value could not be serialized, substituting ") +
                         (*fallback ? fallback : "empty value") + ": " + e.what());
        return fallback;
    }
}

std::string ValueFormatter::to_csv(const Value& value, WireType type) const {
    Value base = normalize(value, type);
    if (is_null(base)) {
        return "";
    }
    if (const auto* document = std::get_if<json>(&base); document && is_json_type(type)) {
        return json_text(*document, "{}");
    }
    return plain_text(base, layout_);
}

std::string ValueFormatter::to_xml(const Value& value, WireType type) const {
    Value base = normalize(value, type);
    if (is_null(base)) {
        return "";
    }
    if (const auto* document = std::get_if<json>(&base); document && is_json_type(type)) {
        return json_text(*document, "");
    }
    return plain_text(base, layout_);
}

json ValueFormatter::to_json(const Value& value, WireType type) const {
    Value base = normalize(value, type);

    struct Visitor {
        const std::string& layout;

        json operator()(std::monostate) const { return nullptr; }
        json operator()(bool v) const { return v; }
        json operator()(std::int64_t v) const { return v; }
        json operator()(double v) const { return v; }
        json operator()(const std::string& v) const { return v; }
        json operator()(const Bytes& v) const { return std::string(v.begin(), v.end()); }
        json operator()(const CivilTime& v) const { return format_time(v, layout); }
        json operator()(const Instant& v) const { return format_time(civil_from_instant(v), layout); }
        json operator()(const Uuid& v) const { return format_uuid(v); }
        json operator()(const Numeric& v) const { return v.text; }
        json operator()(const Interval& v) const { return v.text; }
        json operator()(const json& v) const { return v; }
        json operator()(const ArrayValue& v) const { return v.elements; }
    };
    return std::visit(Visitor{layout_}, base);
}

std::string ValueFormatter::to_sql(const Value& value, WireType type) const {
    if (is_null(value)) {
        return "NULL";
    }

    switch (type) {
        case WireType::DATE:
            if (const auto* civil = std::get_if<CivilTime>(&value)) {
                return quote_literal(format_time(*civil, "yyyy-MM-dd")) + "::date";
            }
            break;
        case WireType::TIMESTAMP:
            if (const auto* civil = std::get_if<CivilTime>(&value)) {
                return quote_literal(format_time(*civil, "yyyy-MM-dd HH:mm:ss.SSS")) + "::timestamp";
            }
            break;
        case WireType::TIMESTAMPTZ:
            if (const auto* instant = std::get_if<Instant>(&value)) {
                int offset = 0;
                CivilTime local = zone_converter_.convert(*instant, &offset);
                return quote_literal(format_time(local, "yyyy-MM-dd HH:mm:ss.SSS") + offset_suffix(offset)) +
                       "::timestamptz";
            }
            break;
        case WireType::UUID:
            if (const auto* uuid = std::get_if<Uuid>(&value)) {
                return quote_literal(format_uuid(*uuid)) + "::uuid";
            }
            break;
        case WireType::BYTEA:
            if (const auto* bytes = std::get_if<Bytes>(&value)) {
                static const char* hex = "0123456789abcdef";
                std::string literal = "'\\x";
                for (std::uint8_t b : *bytes) {
                    literal.push_back(hex[b >> 4]);
                    literal.push_back(hex[b & 0x0F]);
                }
                return literal + "'::bytea";
            }
            break;
        case WireType::NUMERIC: {
            Value parsed = normalize(value, type);
            if (is_null(parsed)) {
                return "NULL";
            }
            if (const auto* number = std::get_if<double>(&parsed)) {
                return sql_float(*number, "numeric");
            }
            break;
        }
        case WireType::INTERVAL:
            if (const auto* interval = std::get_if<Interval>(&value)) {
                return quote_literal(interval->text) + "::interval";
            }
            break;
        case WireType::JSON:
        case WireType::JSONB: {
            const char* cast = type == WireType::JSONB ? "::jsonb" : "::json";
            if (const auto* document = std::get_if<json>(&value)) {
                return quote_literal(json_text(*document, "{}")) + cast;
            }
            break;
        }
        case WireType::BOOL:
        case WireType::PASSTHROUGH:
            break;
    }

    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*integer);
    }
    if (const auto* number = std::get_if<double>(&value)) {
        return sql_float(*number, "float8");
    }
    if (const auto* array = std::get_if<ArrayValue>(&value)) {
        return quote_literal(format_array(*array));
    }
    return quote_literal(plain_text(normalize(value, type), layout_));
}

SpreadsheetCell ValueFormatter::to_spreadsheet(const Value& value, WireType type) const {
    SpreadsheetCell cell;
    if (is_null(value)) {
        return cell;
    }

    if (type == WireType::DATE || type == WireType::TIMESTAMP || type == WireType::TIMESTAMPTZ) {
        if (const auto* civil = std::get_if<CivilTime>(&value)) {
            cell.kind = SpreadsheetCell::Kind::DATETIME;
            cell.datetime = *civil;
            cell.date_only = type == WireType::DATE;
            return cell;
        }
        if (const auto* instant = std::get_if<Instant>(&value)) {
            cell.kind = SpreadsheetCell::Kind::DATETIME;
            cell.datetime = zone_converter_.convert(*instant);
            return cell;
        }
    }

    if (const auto* document = std::get_if<json>(&value); document && is_json_type(type)) {
        cell.kind = SpreadsheetCell::Kind::STRING;
        cell.text = json_text(*document, "{}");
        return cell;
    }

    if (const auto* array = std::get_if<ArrayValue>(&value)) {
        cell.kind = SpreadsheetCell::Kind::STRING;
        cell.text = json_text(array->elements, "[]");
        return cell;
    }

    Value base = normalize(value, type);
    if (is_null(base)) {
        return cell;
    }
    if (const auto* flag = std::get_if<bool>(&base)) {
        cell.kind = SpreadsheetCell::Kind::BOOLEAN;
        cell.boolean = *flag;
    } else if (const auto* integer = std::get_if<std::int64_t>(&base)) {
        cell.kind = SpreadsheetCell::Kind::NUMBER;
        cell.number = static_cast<double>(*integer);
    } else if (const auto* number = std::get_if<double>(&base)) {
        cell.kind = SpreadsheetCell::Kind::NUMBER;
        cell.number = *number;
    } else {
        cell.kind = SpreadsheetCell::Kind::STRING;
        cell.text = plain_text(base, layout_);
    }
    return cell;
}

json ValueFormatter::to_template(const Value& value, WireType type) const {
    if (is_null(value)) {
        return nullptr;
    }

    Value base = normalize(value, type);
    if (const auto* document = std::get_if<json>(&base); document && is_json_type(type)) {
        return json_text(*document, "{}");
    }
    if (const auto* array = std::get_if<ArrayValue>(&base)) {
        return json_text(array->elements, "[]");
    }
    return to_json(base, WireType::PASSTHROUGH);
}

}  // namespace pgexport
