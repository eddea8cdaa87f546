/**
 * @file RowEncoders.cpp
 * @brief Order-preserving row representation and its JSON/YAML encoders
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RowEncoders.hpp"

#include <cctype>
#include <cmath>
#include <regex>

namespace pgexport {

OrderedRow::OrderedRow(const std::vector<FieldDescriptor>& fields, std::vector<Value> values)
    : fields_(fields), values_(std::move(values)) {
    if (values_.size() != fields_.size()) {
        throw ExportError("row has " + std::to_string(values_.size()) + " values for " +
                          std::to_string(fields_.size()) + " columns");
    }
    types_.reserve(fields_.size());
    for (const auto& field : fields_) {
        types_.push_back(field.wire_type());
    }
}

const Value* OrderedRow::find(const std::string& key) const {
    if (index_.empty() && !fields_.empty()) {
        // First occurrence wins for duplicate column names
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            index_.emplace(fields_[i].name, i);
        }
    }
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &values_[it->second];
}

// ============================================================================
// JSON
// ============================================================================

std::string json_scalar_text(const json& node) {
    if (node.is_number_float()) {
        double value = node.get<double>();
        return std::isfinite(value) ? format_float(value) : "null";
    }
    return node.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string OrderedJsonEncoder::encode_row(const OrderedRow& row) const {
    if (row.size() == 0) {
        return "{}";
    }

    std::string out;
    out.reserve(row.size() * 32);
    out += "{\n";

    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            out += ",\n";
        }
        out += "    ";
        out += json(row.key(i)).dump(-1, ' ', false, json::error_handler_t::replace);
        out += ": ";

        json node = formatter_.to_json(row.value(i), row.type(i));
        if (node.is_object() && !node.empty()) {
            std::string pretty = node.dump(2, ' ', false, json::error_handler_t::replace);
            for (char c : pretty) {
                out.push_back(c);
                if (c == '\n') {
                    out += "    ";
                }
            }
        } else {
            out += json_scalar_text(node);
        }
    }

    out += "\n  }";
    return out;
}

// ============================================================================
// YAML
// ============================================================================

bool yaml_needs_quotes(const std::string& text) {
    if (text.empty()) {
        return true;
    }

    static const std::regex RESERVED(
        "~|null|Null|NULL|"
        "y|Y|yes|Yes|YES|n|N|no|No|NO|"
        "true|True|TRUE|false|False|FALSE|"
        "on|On|ON|off|Off|OFF|"
        "[-+]?\\.(inf|Inf|INF)|\\.(nan|NaN|NAN)");
    static const std::regex NUMBER(
        "[-+]?(0x[0-9a-fA-F_]+|0o[0-7_]+|0b[01_]+|"
        "[0-9][0-9_]*(\\.[0-9_]*)?([eE][-+]?[0-9]+)?|"
        "\\.[0-9][0-9_]*([eE][-+]?[0-9]+)?)");

    unsigned char first = static_cast<unsigned char>(text.front());
    if (std::isdigit(first) || first == '-' || first == '+' || first == '.') {
        if (std::regex_match(text, NUMBER)) return true;
    }
    return text.size() <= 5 && std::regex_match(text, RESERVED);
}

void emit_yaml(YAML::Emitter& out, const json& node) {
    switch (node.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            out << YAML::Null;
            return;
        case json::value_t::boolean:
            out << node.get<bool>();
            return;
        case json::value_t::number_integer:
            out << node.get<std::int64_t>();
            return;
        case json::value_t::number_unsigned:
            out << node.get<std::uint64_t>();
            return;
        case json::value_t::number_float: {
            double value = node.get<double>();
            if (std::isnan(value)) {
                out << ".nan";
            } else if (std::isinf(value)) {
                out << (value > 0 ? ".inf" : "-.inf");
            } else {
                out << format_float(value);
            }
            return;
        }
        case json::value_t::string: {
            const auto& text = node.get_ref<const std::string&>();
            if (yaml_needs_quotes(text)) {
                out << YAML::DoubleQuoted << text;
            } else {
                out << text;
            }
            return;
        }
        case json::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& element : node) {
                emit_yaml(out, element);
            }
            out << YAML::EndSeq;
            return;
        case json::value_t::object:
            out << YAML::BeginMap;
            for (auto it = node.begin(); it != node.end(); ++it) {
                out << YAML::Key;
                emit_yaml(out, json(it.key()));
                out << YAML::Value;
                emit_yaml(out, it.value());
            }
            out << YAML::EndMap;
            return;
        case json::value_t::binary:
            break;
    }
    out << YAML::DoubleQuoted << node.dump(-1, ' ', false, json::error_handler_t::replace);
}

void OrderedYamlEncoder::encode_row(YAML::Emitter& out, const OrderedRow& row) const {
    out << YAML::BeginMap;
    for (std::size_t i = 0; i < row.size(); ++i) {
        out << YAML::Key;
        emit_yaml(out, json(row.key(i)));
        out << YAML::Value;
        emit_yaml(out, formatter_.to_json(row.value(i), row.type(i)));
    }
    out << YAML::EndMap;
}

}  // namespace pgexport
