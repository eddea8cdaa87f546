/**
 * @file PgCursor.cpp
 * @brief Cursor over a libpq result streamed in single-row mode
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PgCursor.hpp"
#include "../core/TimeLayout.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace pgexport {

namespace {

// ============================================================================
// Scalar parsers
// ============================================================================

bool parse_int(const std::string& text, std::int64_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = parsed;
    return true;
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (*end != '\0') return false;
    out = parsed;
    return true;
}

/// Read exactly `digits` decimal digits at pos
bool read_digits(const std::string& text, std::size_t& pos, std::size_t digits, int& out) {
    if (pos + digits > text.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += digits;
    out = value;
    return true;
}

/// "YYYY-MM-DD", year possibly longer than four digits
bool parse_date_part(const std::string& text, std::size_t& pos, CivilTime& out) {
    std::size_t start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos - start < 4 || pos >= text.size() || text[pos] != '-') return false;
    out.year = std::atoi(text.substr(start, pos - start).c_str());
    ++pos;
    if (!read_digits(text, pos, 2, out.month) || pos >= text.size() || text[pos] != '-') return false;
    ++pos;
    return read_digits(text, pos, 2, out.day);
}

/// "HH:MM:SS[.ffffff]"
bool parse_time_part(const std::string& text, std::size_t& pos, CivilTime& out) {
    if (!read_digits(text, pos, 2, out.hour) || pos >= text.size() || text[pos] != ':') return false;
    ++pos;
    if (!read_digits(text, pos, 2, out.minute) || pos >= text.size() || text[pos] != ':') return false;
    ++pos;
    if (!read_digits(text, pos, 2, out.second)) return false;

    out.microsecond = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int scale = 100000;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            out.microsecond += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }
    return true;
}

/// "+HH", "-HH:MM" or "+HH:MM:SS"
bool parse_offset(const std::string& text, std::size_t& pos, int& seconds) {
    if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-')) return false;
    int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int hours = 0, minutes = 0, secs = 0;
    if (!read_digits(text, pos, 2, hours)) return false;
    if (pos < text.size() && text[pos] == ':') {
        ++pos;
        if (!read_digits(text, pos, 2, minutes)) return false;
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!read_digits(text, pos, 2, secs)) return false;
        }
    }
    seconds = sign * (hours * 3600 + minutes * 60 + secs);
    return true;
}

bool parse_date(const std::string& text, CivilTime& out) {
    std::size_t pos = 0;
    return parse_date_part(text, pos, out) && pos == text.size();
}

bool parse_timestamp(const std::string& text, CivilTime& out) {
    std::size_t pos = 0;
    if (!parse_date_part(text, pos, out) || pos >= text.size() || text[pos] != ' ') return false;
    ++pos;
    return parse_time_part(text, pos, out) && pos == text.size();
}

bool parse_timestamptz(const std::string& text, Instant& out) {
    CivilTime civil;
    std::size_t pos = 0;
    if (!parse_date_part(text, pos, civil) || pos >= text.size() || text[pos] != ' ') return false;
    ++pos;
    int offset = 0;
    if (!parse_time_part(text, pos, civil) || !parse_offset(text, pos, offset) || pos != text.size()) {
        return false;
    }
    out = instant_from_civil(civil, offset);
    return true;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parse_uuid(const std::string& text, Uuid& out) {
    std::size_t index = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '-') continue;
        if (index >= 32 || i + 1 >= text.size()) return false;
        int high = hex_digit(text[i]);
        int low = hex_digit(text[i + 1]);
        if (high < 0 || low < 0) return false;
        out.bytes[index / 2] = static_cast<std::uint8_t>(high << 4 | low);
        index += 2;
        ++i;
    }
    return index == 32;
}

Bytes parse_bytea(const std::string& text) {
    if (text.size() >= 2 && text[0] == '\\' && text[1] == 'x') {
        Bytes bytes;
        bytes.reserve((text.size() - 2) / 2);
        for (std::size_t i = 2; i + 1 < text.size(); i += 2) {
            int high = hex_digit(text[i]);
            int low = hex_digit(text[i + 1]);
            if (high < 0 || low < 0) break;
            bytes.push_back(static_cast<std::uint8_t>(high << 4 | low));
        }
        return bytes;
    }
    return Bytes(text.begin(), text.end());
}

// ============================================================================
// Arrays
// ============================================================================

std::uint32_t element_oid(std::uint32_t array_oid) {
    switch (array_oid) {
        case oid::BOOL_ARRAY: return oid::BOOL;
        case oid::INT2_ARRAY: return oid::INT2;
        case oid::INT4_ARRAY: return oid::INT4;
        case oid::INT8_ARRAY: return oid::INT8;
        case oid::TEXT_ARRAY: return oid::TEXT;
        case oid::BPCHAR_ARRAY: return oid::BPCHAR;
        case oid::VARCHAR_ARRAY: return oid::VARCHAR;
        case oid::FLOAT4_ARRAY: return oid::FLOAT4;
        case oid::FLOAT8_ARRAY: return oid::FLOAT8;
        case oid::NUMERIC_ARRAY: return oid::NUMERIC;
        case oid::UUID_ARRAY: return oid::UUID;
        default: return 0;
    }
}

json array_element(std::uint32_t type_oid, const std::string& text, bool quoted) {
    if (!quoted && text == "NULL") {
        return nullptr;
    }
    switch (type_oid) {
        case oid::BOOL:
            return text == "t" || text == "true";
        case oid::INT2:
        case oid::INT4:
        case oid::INT8: {
            std::int64_t number = 0;
            if (parse_int(text, number)) return number;
            break;
        }
        case oid::FLOAT4:
        case oid::FLOAT8:
        case oid::NUMERIC: {
            double number = 0.0;
            if (parse_double(text, number)) return number;
            break;
        }
        default:
            break;
    }
    return text;
}

/// Parse one brace-delimited level starting at text[pos] == '{'
bool parse_array_level(const std::string& text, std::size_t& pos, std::uint32_t type_oid, json& out) {
    if (pos >= text.size() || text[pos] != '{') return false;
    ++pos;
    out = json::array();

    if (pos < text.size() && text[pos] == '}') {
        ++pos;
        return true;
    }

    while (pos < text.size()) {
        if (text[pos] == '{') {
            json nested;
            if (!parse_array_level(text, pos, type_oid, nested)) return false;
            out.push_back(std::move(nested));
        } else {
            std::string element;
            bool quoted = false;
            if (text[pos] == '"') {
                quoted = true;
                ++pos;
                while (pos < text.size() && text[pos] != '"') {
                    if (text[pos] == '\\' && pos + 1 < text.size()) ++pos;
                    element.push_back(text[pos++]);
                }
                if (pos >= text.size()) return false;
                ++pos;
            } else {
                while (pos < text.size() && text[pos] != ',' && text[pos] != '}') {
                    element.push_back(text[pos++]);
                }
            }
            out.push_back(array_element(type_oid, element, quoted));
        }

        if (pos >= text.size()) return false;
        if (text[pos] == ',') {
            ++pos;
        } else if (text[pos] == '}') {
            ++pos;
            return true;
        } else {
            return false;
        }
    }
    return false;
}

}  // namespace

// ============================================================================
// decode_value
// ============================================================================

Value decode_value(std::uint32_t type_oid, const char* data, std::size_t length) {
    std::string text(data, length);

    switch (type_oid) {
        case oid::BOOL:
            if (text == "t") return true;
            if (text == "f") return false;
            break;
        case oid::INT2:
        case oid::INT4:
        case oid::INT8:
        case oid::OID: {
            std::int64_t number = 0;
            if (parse_int(text, number)) return number;
            break;
        }
        case oid::FLOAT4:
        case oid::FLOAT8: {
            double number = 0.0;
            if (parse_double(text, number)) return number;
            break;
        }
        case oid::NUMERIC:
            return Numeric{text};
        case oid::DATE: {
            CivilTime civil;
            if (parse_date(text, civil)) return civil;
            break;
        }
        case oid::TIMESTAMP: {
            CivilTime civil;
            if (parse_timestamp(text, civil)) return civil;
            break;
        }
        case oid::TIMESTAMPTZ: {
            Instant instant;
            if (parse_timestamptz(text, instant)) return instant;
            break;
        }
        case oid::UUID: {
            Uuid uuid;
            if (parse_uuid(text, uuid)) return uuid;
            break;
        }
        case oid::BYTEA:
            return parse_bytea(text);
        case oid::INTERVAL:
            return Interval{text};
        case oid::JSON:
        case oid::JSONB: {
            json document = json::parse(text, nullptr, false);
            if (!document.is_discarded()) return document;
            break;
        }
        default: {
            std::uint32_t element = element_oid(type_oid);
            if (element != 0) {
                std::size_t pos = 0;
                json elements;
                if (parse_array_level(text, pos, element, elements) && pos == text.size()) {
                    return ArrayValue{std::move(elements)};
                }
            }
            break;
        }
    }

    // infinity, BC dates, unparsable numbers and every other type
    return text;
}

std::string pq_message(const char* message) {
    std::string text = message != nullptr ? message : "";
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

// ============================================================================
// PgCursor
// ============================================================================

PgCursor::PgCursor(PGconn* connection)
    : connection_(connection), logger_("PgCursor") {
    current_.reset(PQgetResult(connection_));
    if (!current_) {
        done_ = true;
        return;
    }

    ExecStatusType status = PQresultStatus(current_.get());
    if (status != PGRES_SINGLE_TUPLE && status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        std::string message = pq_message(PQresultErrorMessage(current_.get()));
        current_.reset();
        drain();
        throw DatabaseError("query execution failed: " + message);
    }

    int columns = PQnfields(current_.get());
    fields_.reserve(static_cast<std::size_t>(columns));
    for (int i = 0; i < columns; ++i) {
        FieldDescriptor field;
        field.name = PQfname(current_.get(), i);
        field.type_oid = PQftype(current_.get(), i);
        fields_.push_back(std::move(field));
    }
    logger_.debug("Result has " + std::to_string(columns) + " columns");

    if (status == PGRES_SINGLE_TUPLE) {
        first_pending_ = true;
    } else {
        current_.reset();
        drain();
    }
}

PgCursor::~PgCursor() {
    if (done_) {
        return;
    }
    logger_.debug("Cursor closed before exhaustion, cancelling query");
    PGcancel* cancel = PQgetCancel(connection_);
    if (cancel != nullptr) {
        char buffer[256];
        if (PQcancel(cancel, buffer, sizeof(buffer)) == 0) {
            logger_.warning(std::string("Failed to cancel query: ") + buffer);
        }
        PQfreeCancel(cancel);
    }
    current_.reset();
    drain();
}

void PgCursor::drain() {
    while (PGresult* result = PQgetResult(connection_)) {
        PQclear(result);
    }
    done_ = true;
}

bool PgCursor::has_next() {
    if (first_pending_) {
        first_pending_ = false;
        return true;
    }
    if (done_) {
        return false;
    }

    current_.reset(PQgetResult(connection_));
    if (!current_) {
        done_ = true;
        return false;
    }

    ExecStatusType status = PQresultStatus(current_.get());
    if (status == PGRES_SINGLE_TUPLE) {
        return true;
    }
    if (status != PGRES_TUPLES_OK) {
        error_ = pq_message(PQresultErrorMessage(current_.get()));
        logger_.debug("Cursor stopped with error: " + *error_);
    }
    current_.reset();
    drain();
    return false;
}

std::vector<Value> PgCursor::values() {
    if (!current_ || PQresultStatus(current_.get()) != PGRES_SINGLE_TUPLE) {
        throw DatabaseError("no current row");
    }

    std::vector<Value> row;
    row.reserve(fields_.size());
    for (int i = 0; i < static_cast<int>(fields_.size()); ++i) {
        if (PQgetisnull(current_.get(), 0, i)) {
            row.emplace_back(std::monostate{});
            continue;
        }
        row.push_back(decode_value(fields_[static_cast<std::size_t>(i)].type_oid,
                                   PQgetvalue(current_.get(), 0, i),
                                   static_cast<std::size_t>(PQgetlength(current_.get(), 0, i))));
    }
    return row;
}

}  // namespace pgexport
