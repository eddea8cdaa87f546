/**
 * @file test_pg_decoding.cpp
 * @brief Text-format value decoding and connection string masking
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <gtest/gtest.h>

#include "core/TimeLayout.hpp"
#include "db/PgStore.hpp"

#include <cmath>
#include <limits>

using namespace pgexport;

namespace {

Value decode(std::uint32_t type_oid, const std::string& text) {
    return decode_value(type_oid, text.data(), text.size());
}

template <typename T>
T decode_as(std::uint32_t type_oid, const std::string& text) {
    Value value = decode(type_oid, text);
    EXPECT_TRUE(std::holds_alternative<T>(value)) << "for input " << text;
    return std::holds_alternative<T>(value) ? std::get<T>(value) : T{};
}

}  // namespace

TEST(PgDecodingTest, Scalars) {
    EXPECT_TRUE(decode_as<bool>(oid::BOOL, "t"));
    EXPECT_FALSE(decode_as<bool>(oid::BOOL, "f"));
    EXPECT_EQ(decode_as<std::int64_t>(oid::INT8, "-9223372036854775808"), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(decode_as<std::int64_t>(oid::INT2, "42"), 42);
    EXPECT_DOUBLE_EQ(decode_as<double>(oid::FLOAT8, "3.25"), 3.25);
    EXPECT_EQ(decode_as<Numeric>(oid::NUMERIC, "12345678901234567890.01").text, "12345678901234567890.01");
    EXPECT_EQ(decode_as<Interval>(oid::INTERVAL, "1 day 02:00:00").text, "1 day 02:00:00");
    EXPECT_EQ(decode_as<std::string>(oid::TEXT, "hello"), "hello");

    // Special float spellings still decode as numbers
    EXPECT_TRUE(std::isnan(decode_as<double>(oid::FLOAT8, "NaN")));
    EXPECT_TRUE(std::isinf(decode_as<double>(oid::FLOAT4, "-Infinity")));
}

TEST(PgDecodingTest, UnparsableFallsBackToText) {
    EXPECT_EQ(decode_as<std::string>(oid::INT4, "12abc"), "12abc");
    EXPECT_EQ(decode_as<std::string>(oid::DATE, "infinity"), "infinity");
    EXPECT_EQ(decode_as<std::string>(oid::TIMESTAMP, "-infinity"), "-infinity");
    EXPECT_EQ(decode_as<std::string>(oid::DATE, "2024-01-15 BC"), "2024-01-15 BC");
    EXPECT_EQ(decode_as<std::string>(oid::JSON, "{not json"), "{not json");
}

TEST(PgDecodingTest, DatesAndTimestamps) {
    CivilTime date = decode_as<CivilTime>(oid::DATE, "2024-02-29");
    EXPECT_EQ(date, (CivilTime{2024, 2, 29, 0, 0, 0, 0}));

    CivilTime stamp = decode_as<CivilTime>(oid::TIMESTAMP, "2024-01-15 10:30:45.123");
    EXPECT_EQ(stamp, (CivilTime{2024, 1, 15, 10, 30, 45, 123000}));

    CivilTime whole = decode_as<CivilTime>(oid::TIMESTAMP, "1999-12-31 23:59:59");
    EXPECT_EQ(whole.microsecond, 0);
}

TEST(PgDecodingTest, TimestampWithZoneIsAbsolute) {
    Instant plus_one = decode_as<Instant>(oid::TIMESTAMPTZ, "2024-01-15 10:30:00+01");
    Instant utc = decode_as<Instant>(oid::TIMESTAMPTZ, "2024-01-15 09:30:00+00");
    EXPECT_EQ(plus_one, utc);
    EXPECT_EQ(utc, instant_from_civil(CivilTime{2024, 1, 15, 9, 30, 0, 0}));

    Instant india = decode_as<Instant>(oid::TIMESTAMPTZ, "2024-01-15 15:00:00.5+05:30");
    EXPECT_EQ(india.micros, utc.micros + 500000);
}

TEST(PgDecodingTest, UuidAndBytea) {
    Uuid uuid = decode_as<Uuid>(oid::UUID, "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11");
    EXPECT_EQ(uuid.bytes[0], 0xa0);
    EXPECT_EQ(uuid.bytes[15], 0x11);

    EXPECT_EQ(decode_as<Bytes>(oid::BYTEA, "\\x0aff"), (Bytes{0x0a, 0xff}));
    EXPECT_TRUE(decode_as<Bytes>(oid::BYTEA, "\\x").empty());
}

TEST(PgDecodingTest, JsonDocuments) {
    json document = decode_as<json>(oid::JSONB, R"({"a": [1, 2], "b": null})");
    EXPECT_EQ(document["a"][1], 2);
    EXPECT_TRUE(document["b"].is_null());
}

TEST(PgDecodingTest, Arrays) {
    ArrayValue ints = decode_as<ArrayValue>(oid::INT4_ARRAY, "{1,2,NULL}");
    EXPECT_EQ(ints.elements, json::parse("[1, 2, null]"));

    ArrayValue texts = decode_as<ArrayValue>(oid::TEXT_ARRAY, R"({plain,"with space","NULL","quote\"d"})");
    EXPECT_EQ(texts.elements, json::parse(R"(["plain", "with space", "NULL", "quote\"d"])"));

    ArrayValue nested = decode_as<ArrayValue>(oid::FLOAT8_ARRAY, "{{1.5,2},{3,4}}");
    EXPECT_EQ(nested.elements, json::parse("[[1.5, 2.0], [3.0, 4.0]]"));

    ArrayValue flags = decode_as<ArrayValue>(oid::BOOL_ARRAY, "{t,f}");
    EXPECT_EQ(flags.elements, json::parse("[true, false]"));

    EXPECT_TRUE(decode_as<ArrayValue>(oid::INT8_ARRAY, "{}").elements.empty());
    EXPECT_EQ(decode_as<std::string>(oid::INT4_ARRAY, "{1,2"), "{1,2");
}

TEST(PgDecodingTest, PqMessageTrimsNewlines) {
    EXPECT_EQ(pq_message("ERROR:  relation \"x\" does not exist\n"), "ERROR:  relation \"x\" does not exist");
    EXPECT_EQ(pq_message(nullptr), "");
}

TEST(PgDecodingTest, SanitizeUrlDsn) {
    EXPECT_EQ(sanitize_dsn("postgres://u:secret@h:5432/db?sslmode=require"), "postgres://u:***@h:5432/db");
    EXPECT_EQ(sanitize_dsn("postgres://u@h/db"), "postgres://u@h/db");
    EXPECT_EQ(sanitize_dsn("postgresql://h:5432"), "postgresql://h:5432/");
}

TEST(PgDecodingTest, SanitizeKeywordDsn) {
    EXPECT_EQ(sanitize_dsn("host=x password=secret user=u"), "host=x password=*** user=u");
    EXPECT_EQ(sanitize_dsn("host=x password = 'a b' user=u"), "host=x password = *** user=u");
    EXPECT_EQ(sanitize_dsn("host=x user=u"), "host=x user=u");
}

TEST(PgDecodingTest, NonIsoDateStylesStayText) {
    EXPECT_EQ(decode_as<std::string>(oid::DATE, "17/05/2024"), "17/05/2024");
    EXPECT_EQ(decode_as<std::string>(oid::DATE, "17.05.2024"), "17.05.2024");
    EXPECT_EQ(decode_as<std::string>(oid::TIMESTAMP, "05/17/2024 10:00:00"), "05/17/2024 10:00:00");
    EXPECT_EQ(decode_as<std::string>(oid::TIMESTAMPTZ, "Fri May 17 10:00:00 2024 CEST"),
              "Fri May 17 10:00:00 2024 CEST");
}

TEST(PgDecodingTest, SessionSetupPinsIsoAndHex) {
    std::string setup = SESSION_SETUP_SQL;
    EXPECT_NE(setup.find("SET DateStyle TO ISO"), std::string::npos);
    EXPECT_NE(setup.find("SET bytea_output TO hex"), std::string::npos);
    EXPECT_NE(setup.find("SET IntervalStyle TO postgres"), std::string::npos);

    // The ISO form the setup guarantees decodes to typed values
    EXPECT_EQ(decode_as<CivilTime>(oid::DATE, "2024-05-17"), (CivilTime{2024, 5, 17, 0, 0, 0, 0}));
    EXPECT_EQ(decode_as<Bytes>(oid::BYTEA, "\\x01ff"), (Bytes{0x01, 0xff}));
}
