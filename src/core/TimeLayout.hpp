/**
 * @file TimeLayout.hpp
 * @brief User time layouts, civil-time arithmetic and zone conversion
 *
 * Layouts are written with the tokens yyyy, yy, MM, dd, HH, mm, ss,
 * SSS (milliseconds), SS (centiseconds) and S (deciseconds). Everything
 * else is copied literally.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace pgexport {

/**
 * @brief Render a civil time with a user layout
 */
std::string format_time(const CivilTime& time, const std::string& layout);

/**
 * @brief Date-only prefix of a layout
 *
 * Finds the rightmost occurrence of each date token (yyyy, yy, MM, dd),
 * cuts the layout right after the one that ends furthest, and trims
 * surrounding whitespace. A layout without date tokens is returned as is.
 *
 * "yyyy-MM-dd HH:mm:ss" -> "yyyy-MM-dd"
 */
std::string extract_date_layout(const std::string& layout);

/**
 * @brief Translate a user layout into a spreadsheet number format
 *
 * "yyyy-MM-dd HH:mm:ss.SSS" -> "yyyy-mm-dd hh:mm:ss.000"
 */
std::string to_spreadsheet_format(const std::string& layout);

/**
 * @brief True if the name resolves to a zoneinfo entry (or UTC/Local)
 */
bool is_valid_time_zone(const std::string& zone);

/// Days since 1970-01-01 for a proleptic Gregorian date
std::int64_t days_from_civil(int year, int month, int day);

/// Civil time in UTC for an instant
CivilTime civil_from_instant(const Instant& instant);

/// Instant for a civil time carrying a UTC offset in seconds
Instant instant_from_civil(const CivilTime& time, int utc_offset_seconds = 0);

/**
 * @brief Instant to wall-clock conversion for one zone
 *
 * Offsets come from the C library and are memoized per UTC day. A day
 * whose first and last second share an offset is taken to contain no
 * transition; days with a transition are resolved per value. Only cache
 * misses switch TZ, so exporting many values in one zone touches the
 * process environment once per distinct day.
 *
 * An empty zone (or "Local") means the process local zone. The caller
 * validates the name first; an unknown name behaves like UTC at the C
 * library level.
 */
class ZoneConverter {
public:
    explicit ZoneConverter(std::string zone = "");

    /// @param offset_seconds Receives the zone's UTC offset at that instant
    CivilTime convert(const Instant& instant, int* offset_seconds = nullptr) const;

    const std::string& zone() const { return zone_; }

    /// Number of days with a memoized offset
    std::size_t cached_days() const { return day_offsets_.size(); }

private:
    std::string zone_;
    bool utc_;
    mutable std::unordered_map<std::int64_t, int> day_offsets_;

    int offset_at(std::int64_t seconds) const;
};

/**
 * @brief One-off conversion of an instant to wall-clock time in a zone
 *
 * Use a ZoneConverter when converting many values.
 */
CivilTime to_zone(const Instant& instant, const std::string& zone, int* offset_seconds = nullptr);

/**
 * @brief Current local time as RFC 3339 ("2025-01-02T15:04:05+01:00")
 */
std::string now_rfc3339();

}  // namespace pgexport
