/**
 * @file test_json_exporter.cpp
 * @brief JSON array document layout
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "export/JsonExporter.hpp"

using namespace pgexport;
using namespace pgexport::testing;

namespace {

ExportOptions json_options() {
    ExportOptions options;
    options.format = FORMAT_JSON;
    options.output_path = "out.json";
    return options;
}

}  // namespace

TEST(JsonExporterTest, WritesIndentedArray) {
    auto capture = std::make_shared<SinkCapture>();
    JsonExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor(id_name_fields(), id_name_rows(2));
    EXPECT_EQ(exporter.export_rows(cursor, json_options()), 2u);
    EXPECT_EQ(capture->data,
              "[\n"
              "  {\n    \"id\": 1,\n    \"name\": \"name1\"\n  },\n"
              "  {\n    \"id\": 2,\n    \"name\": \"name2\"\n  }\n"
              "]\n");
    EXPECT_EQ(capture->close_count, 1);
}

TEST(JsonExporterTest, EmptyResultIsEmptyArray) {
    auto capture = std::make_shared<SinkCapture>();
    JsonExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor(id_name_fields(), {});
    EXPECT_EQ(exporter.export_rows(cursor, json_options()), 0u);
    EXPECT_EQ(capture->data, "[\n\n]\n");
    EXPECT_TRUE(json::parse(capture->data).empty());
}

TEST(JsonExporterTest, OutputParsesWithTypedValues) {
    auto capture = std::make_shared<SinkCapture>();
    JsonExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor({{"price", oid::NUMERIC}, {"active", oid::BOOL}, {"meta", oid::JSONB}, {"gone", oid::TEXT}},
                      {{Numeric{"12.50"}, true, json::parse(R"({"tags":["a","b"]})"), Value{}}});
    ASSERT_EQ(exporter.export_rows(cursor, json_options()), 1u);

    json document = json::parse(capture->data);
    ASSERT_EQ(document.size(), 1u);
    EXPECT_DOUBLE_EQ(document[0]["price"].get<double>(), 12.5);
    EXPECT_TRUE(document[0]["active"].get<bool>());
    EXPECT_EQ(document[0]["meta"]["tags"][1], "b");
    EXPECT_TRUE(document[0]["gone"].is_null());
}

TEST(JsonExporterTest, RowFailureClosesSinkOnce) {
    auto capture = std::make_shared<SinkCapture>();
    JsonExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor(id_name_fields(), id_name_rows(4));
    cursor.fail_at_row = 2;

    EXPECT_THROW(exporter.export_rows(cursor, json_options()), RowError);
    EXPECT_EQ(capture->close_count, 1);
}
