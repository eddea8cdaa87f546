/**
 * @file TimeLayout.cpp
 * @brief Token-based time layouts and zone conversion through the C library
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TimeLayout.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <optional>
#include <utility>

namespace pgexport {

namespace {

enum class Token { YEAR4, YEAR2, MONTH, DAY, HOUR, MINUTE, SECOND, MILLIS, CENTIS, DECIS };

struct TokenSpec {
    const char* text;
    Token token;
};

// Longer tokens first so "yyyy" wins over "yy" and "SSS" over "S".
constexpr std::array<TokenSpec, 10> TOKENS = {{
    {"yyyy", Token::YEAR4},
    {"yy", Token::YEAR2},
    {"MM", Token::MONTH},
    {"dd", Token::DAY},
    {"HH", Token::HOUR},
    {"mm", Token::MINUTE},
    {"ss", Token::SECOND},
    {"SSS", Token::MILLIS},
    {"SS", Token::CENTIS},
    {"S", Token::DECIS},
}};

std::optional<TokenSpec> match_token(const std::string& layout, size_t pos) {
    for (const auto& spec : TOKENS) {
        if (layout.compare(pos, std::char_traits<char>::length(spec.text), spec.text) == 0) {
            return spec;
        }
    }
    return std::nullopt;
}

std::string pad(int value, int width) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%0*d", width, value);
    return buffer;
}

/**
 * @brief Temporarily switch the C library's zone through TZ
 *
 * Restores the previous TZ value (or its absence) on destruction.
 */
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const std::string& zone) {
        if (const char* previous = std::getenv("TZ")) {
            previous_ = std::string(previous);
        }
        setenv("TZ", zone.c_str(), 1);
        tzset();
    }

    ~ScopedTimeZone() {
        if (previous_.has_value()) {
            setenv("TZ", previous_->c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }

    ScopedTimeZone(const ScopedTimeZone&) = delete;
    ScopedTimeZone& operator=(const ScopedTimeZone&) = delete;

private:
    std::optional<std::string> previous_;
};

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}  // namespace

std::string format_time(const CivilTime& time, const std::string& layout) {
    std::string out;
    out.reserve(layout.size() + 8);

    size_t pos = 0;
    while (pos < layout.size()) {
        auto spec = match_token(layout, pos);
        if (!spec.has_value()) {
            out.push_back(layout[pos]);
            ++pos;
            continue;
        }

        switch (spec->token) {
            case Token::YEAR4: out += pad(time.year, 4); break;
            case Token::YEAR2: out += pad(((time.year % 100) + 100) % 100, 2); break;
            case Token::MONTH: out += pad(time.month, 2); break;
            case Token::DAY: out += pad(time.day, 2); break;
            case Token::HOUR: out += pad(time.hour, 2); break;
            case Token::MINUTE: out += pad(time.minute, 2); break;
            case Token::SECOND: out += pad(time.second, 2); break;
            case Token::MILLIS: out += pad(time.microsecond / 1000, 3); break;
            case Token::CENTIS: out += pad(time.microsecond / 10000, 2); break;
            case Token::DECIS: out += pad(time.microsecond / 100000, 1); break;
        }
        pos += std::char_traits<char>::length(spec->text);
    }
    return out;
}

std::string extract_date_layout(const std::string& layout) {
    static const std::array<std::string, 4> date_tokens = {"yyyy", "yy", "MM", "dd"};

    std::string::size_type last = std::string::npos;
    for (const auto& token : date_tokens) {
        auto idx = layout.rfind(token);
        if (idx == std::string::npos) continue;
        auto end = idx + token.size();
        if (last == std::string::npos || end > last) {
            last = end;
        }
    }

    if (last == std::string::npos) {
        return layout;
    }

    std::string date_layout = layout.substr(0, last);
    date_layout.erase(0, date_layout.find_first_not_of(" \t\n\r"));
    date_layout.erase(date_layout.find_last_not_of(" \t\n\r") + 1);
    return date_layout;
}

std::string to_spreadsheet_format(const std::string& layout) {
    std::string out;
    size_t pos = 0;
    while (pos < layout.size()) {
        auto spec = match_token(layout, pos);
        if (!spec.has_value()) {
            char c = layout[pos];
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '"' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
            ++pos;
            continue;
        }

        switch (spec->token) {
            case Token::YEAR4: out += "yyyy"; break;
            case Token::YEAR2: out += "yy"; break;
            case Token::MONTH: out += "mm"; break;
            case Token::DAY: out += "dd"; break;
            case Token::HOUR: out += "hh"; break;
            case Token::MINUTE: out += "mm"; break;
            case Token::SECOND: out += "ss"; break;
            case Token::MILLIS: out += "000"; break;
            case Token::CENTIS: out += "00"; break;
            case Token::DECIS: out += "0"; break;
        }
        pos += std::char_traits<char>::length(spec->text);
    }
    return out;
}

bool is_valid_time_zone(const std::string& zone) {
    if (zone.empty()) return false;
    if (zone == "UTC" || zone == "Local") return true;
    if (zone.front() == '/' || zone.find("..") != std::string::npos) return false;

    std::filesystem::path root = "/usr/share/zoneinfo";
    if (const char* tzdir = std::getenv("TZDIR")) {
        root = tzdir;
    }

    std::error_code ec;
    return std::filesystem::is_regular_file(root / zone, ec);
}

std::int64_t days_from_civil(int year, int month, int day) {
    // Hinnant's days_from_civil
    std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    std::int64_t era = floor_div(y, 400);
    std::int64_t yoe = y - era * 400;
    std::int64_t mp = (month + 9) % 12;
    std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilTime civil_from_instant(const Instant& instant) {
    constexpr std::int64_t MICROS_PER_DAY = 86400LL * 1000000LL;

    std::int64_t days = floor_div(instant.micros, MICROS_PER_DAY);
    std::int64_t rem = instant.micros - days * MICROS_PER_DAY;

    std::int64_t z = days + 719468;
    std::int64_t era = floor_div(z, 146097);
    std::int64_t doe = z - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp = (5 * doy + 2) / 153;
    std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
    std::int64_t m = mp < 10 ? mp + 3 : mp - 9;

    CivilTime time;
    time.year = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    time.month = static_cast<int>(m);
    time.day = static_cast<int>(d);

    std::int64_t seconds = rem / 1000000;
    time.hour = static_cast<int>(seconds / 3600);
    time.minute = static_cast<int>((seconds % 3600) / 60);
    time.second = static_cast<int>(seconds % 60);
    time.microsecond = static_cast<int>(rem % 1000000);
    return time;
}

Instant instant_from_civil(const CivilTime& time, int utc_offset_seconds) {
    std::int64_t days = days_from_civil(time.year, time.month, time.day);
    std::int64_t seconds = days * 86400 + time.hour * 3600 + time.minute * 60 + time.second
                           - utc_offset_seconds;
    return Instant{seconds * 1000000 + time.microsecond};
}

// ============================================================================
// ZoneConverter
// ============================================================================

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;
constexpr std::int64_t MICROS_PER_SECOND = 1000000;
constexpr std::size_t MAX_CACHED_DAYS = 65536;

/// UTC offsets of the current TZ setting at each of the given instants
void local_offsets(const std::int64_t* seconds, int* offsets, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        std::time_t t = static_cast<std::time_t>(seconds[i]);
        std::tm tm_value{};
        localtime_r(&t, &tm_value);
        offsets[i] = static_cast<int>(tm_value.tm_gmtoff);
    }
}

}  // namespace

ZoneConverter::ZoneConverter(std::string zone)
    : zone_(std::move(zone)), utc_(zone_ == "UTC") {}

int ZoneConverter::offset_at(std::int64_t seconds) const {
    std::int64_t day = floor_div(seconds, SECONDS_PER_DAY);
    auto cached = day_offsets_.find(day);
    if (cached != day_offsets_.end()) {
        return cached->second;
    }

    std::int64_t samples[3] = {day * SECONDS_PER_DAY, day * SECONDS_PER_DAY + SECONDS_PER_DAY - 1, seconds};
    int offsets[3] = {0, 0, 0};
    if (zone_.empty() || zone_ == "Local") {
        local_offsets(samples, offsets, 3);
    } else {
        ScopedTimeZone scope(zone_);
        local_offsets(samples, offsets, 3);
    }

    if (offsets[0] == offsets[1]) {
        if (day_offsets_.size() >= MAX_CACHED_DAYS) {
            day_offsets_.clear();
        }
        day_offsets_.emplace(day, offsets[0]);
    }
    return offsets[2];
}

CivilTime ZoneConverter::convert(const Instant& instant, int* offset_seconds) const {
    int offset = 0;
    if (!utc_) {
        offset = offset_at(floor_div(instant.micros, MICROS_PER_SECOND));
    }
    if (offset_seconds) *offset_seconds = offset;
    return civil_from_instant(Instant{instant.micros + offset * MICROS_PER_SECOND});
}

CivilTime to_zone(const Instant& instant, const std::string& zone, int* offset_seconds) {
    return ZoneConverter(zone).convert(instant, offset_seconds);
}

std::string now_rfc3339() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&t, &tm_value);

    char buffer[40];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_value);

    long offset = tm_value.tm_gmtoff;
    if (offset == 0) {
        return std::string(buffer) + "Z";
    }
    char sign = offset < 0 ? '-' : '+';
    offset = offset < 0 ? -offset : offset;
    char zone[16];
    std::snprintf(zone, sizeof(zone), "%c%02ld:%02ld", sign, offset / 3600, (offset % 3600) / 60);
    return std::string(buffer) + zone;
}

}  // namespace pgexport
