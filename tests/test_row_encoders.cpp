/**
 * @file test_row_encoders.cpp
 * @brief Column-order preservation in the JSON and YAML row encoders
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <gtest/gtest.h>

#include "export/RowEncoders.hpp"

#include <cmath>
#include <limits>

using namespace pgexport;

namespace {

std::vector<FieldDescriptor> reversed_fields() {
    return {{"zeta", oid::INT4}, {"alpha", oid::TEXT}, {"mid", oid::JSONB}};
}

}  // namespace

TEST(OrderedRowTest, KeepsDescriptorOrder) {
    auto fields = reversed_fields();
    OrderedRow row(fields, {std::int64_t{1}, std::string("a"), json::object()});
    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row.key(0), "zeta");
    EXPECT_EQ(row.key(2), "mid");
    EXPECT_EQ(row.type(2), WireType::JSONB);
}

TEST(OrderedRowTest, FindUsesFirstDuplicate) {
    std::vector<FieldDescriptor> fields = {{"x", oid::INT4}, {"x", oid::INT4}};
    OrderedRow row(fields, {std::int64_t{1}, std::int64_t{2}});
    const Value* found = row.find("x");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(std::get<std::int64_t>(*found), 1);
    EXPECT_EQ(row.find("missing"), nullptr);
}

TEST(OrderedRowTest, ArityMismatchThrows) {
    auto fields = reversed_fields();
    EXPECT_THROW({ OrderedRow row(fields, {std::int64_t{1}}); }, ExportError);
}

TEST(OrderedJsonEncoderTest, EncodesInColumnOrder) {
    ValueFormatter formatter("", "");
    OrderedJsonEncoder encoder(formatter);
    auto fields = reversed_fields();
    OrderedRow row(fields, {std::int64_t{1}, std::string("a\"b"), Value{}});
    EXPECT_EQ(encoder.encode_row(row),
              "{\n    \"zeta\": 1,\n    \"alpha\": \"a\\\"b\",\n    \"mid\": null\n  }");
}

TEST(OrderedJsonEncoderTest, NestedObjectsAreIndented) {
    ValueFormatter formatter("", "");
    OrderedJsonEncoder encoder(formatter);
    std::vector<FieldDescriptor> fields = {{"doc", oid::JSONB}};
    OrderedRow row(fields, {json::parse(R"({"k":true})")});
    EXPECT_EQ(encoder.encode_row(row), "{\n    \"doc\": {\n      \"k\": true\n    }\n  }");
}

TEST(OrderedJsonEncoderTest, EmptyRow) {
    ValueFormatter formatter("", "");
    OrderedJsonEncoder encoder(formatter);
    std::vector<FieldDescriptor> fields;
    OrderedRow row(fields, {});
    EXPECT_EQ(encoder.encode_row(row), "{}");
}

TEST(JsonScalarTextTest, NonFiniteFloatsBecomeNull) {
    EXPECT_EQ(json_scalar_text(json(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(json_scalar_text(json(2.5)), "2.5");
    EXPECT_EQ(json_scalar_text(json("x")), "\"x\"");
}

namespace {

std::string emit_row(const OrderedYamlEncoder& encoder, const OrderedRow& row) {
    YAML::Emitter out;
    out.SetNullFormat(YAML::LowerNull);
    encoder.encode_row(out, row);
    EXPECT_TRUE(out.good()) << out.GetLastError();
    return out.c_str();
}

std::string emit_node(const json& node) {
    YAML::Emitter out;
    emit_yaml(out, node);
    return out.c_str();
}

}  // namespace

TEST(OrderedYamlEncoderTest, KeepsColumnOrder) {
    ValueFormatter formatter("", "");
    OrderedYamlEncoder encoder(formatter);
    auto fields = reversed_fields();
    OrderedRow row(fields, {std::int64_t{5}, std::string("b"), json::parse(R"({"n":1})")});

    YAML::Node node = YAML::Load(emit_row(encoder, row));
    ASSERT_TRUE(node.IsMap());

    std::vector<std::string> keys;
    for (const auto& entry : node) {
        keys.push_back(entry.first.as<std::string>());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"zeta", "alpha", "mid"}));
    EXPECT_EQ(node["zeta"].as<int>(), 5);
    EXPECT_EQ(node["mid"]["n"].as<int>(), 1);
}

TEST(OrderedYamlEncoderTest, AmbiguousTextStaysText) {
    ValueFormatter formatter("", "");
    OrderedYamlEncoder encoder(formatter);
    std::vector<FieldDescriptor> fields = {{"code", oid::TEXT}, {"flag", oid::TEXT}, {"nothing", oid::TEXT},
                                           {"count", oid::INT4}, {"on", oid::BOOL}};
    OrderedRow row(fields, {std::string("00123"), std::string("true"), std::string("null"),
                            std::int64_t{7}, true});

    std::string text = emit_row(encoder, row);
    EXPECT_NE(text.find("code: \"00123\""), std::string::npos) << text;
    EXPECT_NE(text.find("flag: \"true\""), std::string::npos) << text;
    EXPECT_NE(text.find("count: 7"), std::string::npos) << text;

    YAML::Node node = YAML::Load(text);
    EXPECT_EQ(node["code"].Tag(), "!");
    EXPECT_EQ(node["code"].as<std::string>(), "00123");
    EXPECT_EQ(node["flag"].Tag(), "!");
    EXPECT_FALSE(node["nothing"].IsNull());
    EXPECT_EQ(node["nothing"].as<std::string>(), "null");
    EXPECT_EQ(node["count"].Tag(), "?");
    EXPECT_EQ(node["count"].as<int>(), 7);
    EXPECT_NE(text.find("\"on\": true"), std::string::npos) << text;
    EXPECT_TRUE(node["on"].as<bool>());
}

TEST(YamlNeedsQuotesTest, ResolvesLikeAYamlReader) {
    for (const char* text : {"", "00123", "12", "-3.5", "1e10", ".5", "0x1F", "0o17", "true", "False", "yes",
                             "off", "~", "null", "NULL", ".inf", "-.inf", ".nan"}) {
        EXPECT_TRUE(yaml_needs_quotes(text)) << text;
    }
    for (const char* text : {"abc", "12abc", "1.2.3", "v1", "-", "truthy", "nullable", "2024-01-15"}) {
        EXPECT_FALSE(yaml_needs_quotes(text)) << text;
    }
}

TEST(EmitYamlTest, SpecialFloats) {
    EXPECT_EQ(emit_node(json(std::nan(""))), ".nan");
    EXPECT_EQ(emit_node(json(-std::numeric_limits<double>::infinity())), "-.inf");
    EXPECT_EQ(emit_node(json(0.1 + 0.2)), "0.3");
    EXPECT_EQ(emit_node(json("12")), "\"12\"");
}
