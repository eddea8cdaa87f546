/**
 * @file RowEncoders.hpp
 * @brief Order-preserving row representation and its JSON/YAML encoders
 *
 * A row is a sequence of (column, value) pairs in descriptor order. The
 * encoders walk that sequence front to back, so no output depends on the
 * iteration order of a hashed container.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"
#include "ValueFormatter.hpp"

#include <string>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace pgexport {

/**
 * @brief One result row aligned with its field descriptors
 */
class OrderedRow {
public:
    /// @throws ExportError if the value count differs from the column count
    OrderedRow(const std::vector<FieldDescriptor>& fields, std::vector<Value> values);

    std::size_t size() const { return values_.size(); }
    const std::string& key(std::size_t index) const { return fields_[index].name; }
    const Value& value(std::size_t index) const { return values_[index]; }
    WireType type(std::size_t index) const { return types_[index]; }

    /**
     * @brief Keyed lookup; the index is built on first use
     * @return nullptr when no column has that name
     */
    const Value* find(const std::string& key) const;

private:
    const std::vector<FieldDescriptor>& fields_;
    std::vector<Value> values_;
    std::vector<WireType> types_;
    mutable std::unordered_map<std::string, std::size_t> index_;
};

/**
 * @brief Hand-emitted JSON object for one row
 *
 * Output is indented for placement inside a top-level array:
 *
 *   {
 *       "id": 1,
 *       "name": "x"
 *     }
 *
 * The caller writes the two leading spaces. Nested objects are pretty
 * printed and re-indented; everything else is compact. Floating point
 * values use the 15 significant digit rule and non-finite values are null.
 */
class OrderedJsonEncoder {
public:
    explicit OrderedJsonEncoder(const ValueFormatter& formatter) : formatter_(formatter) {}

    std::string encode_row(const OrderedRow& row) const;

private:
    const ValueFormatter& formatter_;
};

/**
 * @brief YAML block mapping for one row, written straight to an emitter
 *
 * Strings that a YAML reader would resolve to another type (numbers,
 * booleans, null, octal) are double quoted so they load back as strings.
 */
class OrderedYamlEncoder {
public:
    explicit OrderedYamlEncoder(const ValueFormatter& formatter) : formatter_(formatter) {}

    void encode_row(YAML::Emitter& out, const OrderedRow& row) const;

private:
    const ValueFormatter& formatter_;
};

/// Compact JSON text of a node, floats rendered with format_float()
std::string json_scalar_text(const json& node);

/// Emit a JSON node as YAML; object key order follows the source
void emit_yaml(YAML::Emitter& out, const json& node);

/// True when a plain scalar with this text would not load as a string
bool yaml_needs_quotes(const std::string& text);

}  // namespace pgexport
