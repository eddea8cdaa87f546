/**
 * @file test_sql_exporter.cpp
 * @brief INSERT statement batching and literal rendering
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "export/SqlExporter.hpp"

using namespace pgexport;
using namespace pgexport::testing;

namespace {

ExportOptions sql_options(int batch) {
    ExportOptions options;
    options.format = FORMAT_SQL;
    options.output_path = "out.sql";
    options.table_name = "users";
    options.rows_per_statement = batch;
    return options;
}

std::size_t count_occurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

}  // namespace

TEST(SqlInsertTest, BuildInsert) {
    EXPECT_EQ(SqlExporter::build_insert("\"t\"", {"\"a\"", "\"b\""}, {{"1", "'x'"}, {"2", "'y'"}}),
              "INSERT INTO \"t\" (\"a\", \"b\") VALUES\n\t(1, 'x'),\n\t(2, 'y');\n");
}

TEST(SqlExporterTest, OneStatementPerRowByDefault) {
    auto capture = std::make_shared<SinkCapture>();
    SqlExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor(id_name_fields(), {{std::int64_t{1}, std::string("O'Neil")}, {std::int64_t{2}, Value{}}});
    EXPECT_EQ(exporter.export_rows(cursor, sql_options(1)), 2u);
    EXPECT_EQ(exporter.statements_written(), 2u);
    EXPECT_EQ(capture->data,
              "INSERT INTO \"users\" (\"id\", \"name\") VALUES\n\t(1, 'O''Neil');\n"
              "INSERT INTO \"users\" (\"id\", \"name\") VALUES\n\t(2, NULL);\n");
    EXPECT_EQ(capture->close_count, 1);
}

TEST(SqlExporterTest, BatchesRoundUp) {
    auto capture = std::make_shared<SinkCapture>();
    SqlExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor(id_name_fields(), id_name_rows(7));
    EXPECT_EQ(exporter.export_rows(cursor, sql_options(3)), 7u);
    EXPECT_EQ(exporter.statements_written(), 3u);
    EXPECT_EQ(count_occurrences(capture->data, "INSERT INTO"), 3u);
    EXPECT_EQ(count_occurrences(capture->data, ";\n"), 3u);
}

TEST(SqlExporterTest, LastStatementHoldsRemainder) {
    auto capture = std::make_shared<SinkCapture>();
    SqlExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor(id_name_fields(), id_name_rows(7));
    EXPECT_EQ(exporter.export_rows(cursor, sql_options(3)), 7u);

    const std::string header = "INSERT INTO \"users\" (\"id\", \"name\") VALUES\n";
    EXPECT_EQ(capture->data,
              header + "\t(1, 'name1'),\n\t(2, 'name2'),\n\t(3, 'name3');\n" +
              header + "\t(4, 'name4'),\n\t(5, 'name5'),\n\t(6, 'name6');\n" +
              header + "\t(7, 'name7');\n");
}

TEST(SqlExporterTest, ColumnsFollowResultOrder) {
    auto capture = std::make_shared<SinkCapture>();
    SqlExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor({{"name", oid::TEXT}, {"id", oid::INT4}},
                      {{std::string("b"), std::int64_t{2}}, {std::string("a"), std::int64_t{1}}});
    EXPECT_EQ(exporter.export_rows(cursor, sql_options(2)), 2u);
    EXPECT_EQ(capture->data,
              "INSERT INTO \"users\" (\"name\", \"id\") VALUES\n\t('b', 2),\n\t('a', 1);\n");
}

TEST(SqlExporterTest, SchemaQualifiedTable) {
    auto capture = std::make_shared<SinkCapture>();
    SqlExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    ExportOptions options = sql_options(10);
    options.table_name = "archive.users";
    FakeCursor cursor(id_name_fields(), id_name_rows(1));
    exporter.export_rows(cursor, options);
    EXPECT_EQ(capture->data.rfind("INSERT INTO \"archive\".\"users\" (", 0), 0u);
}

TEST(SqlExporterTest, EmptyResultWritesNothing) {
    auto capture = std::make_shared<SinkCapture>();
    SqlExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    FakeCursor cursor(id_name_fields(), {});
    EXPECT_EQ(exporter.export_rows(cursor, sql_options(5)), 0u);
    EXPECT_EQ(exporter.statements_written(), 0u);
    EXPECT_TRUE(capture->data.empty());
    EXPECT_EQ(capture->close_count, 1);
}

TEST(SqlExporterTest, MissingTableIsConfigurationError) {
    auto capture = std::make_shared<SinkCapture>();
    SqlExporter exporter;
    exporter.set_sink_factory(capture_sink_factory(capture));

    ExportOptions options = sql_options(1);
    options.table_name.clear();
    FakeCursor cursor(id_name_fields(), id_name_rows(1));
    EXPECT_THROW(exporter.export_rows(cursor, options), ConfigurationError);

    options = sql_options(0);
    EXPECT_THROW(exporter.export_rows(cursor, options), ConfigurationError);
    EXPECT_EQ(capture->close_count, 0);
}
