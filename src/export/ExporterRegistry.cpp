/**
 * @file ExporterRegistry.cpp
 * @brief Format name to exporter factory table
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExporterRegistry.hpp"
#include "CsvExporter.hpp"
#include "JsonExporter.hpp"
#include "SqlExporter.hpp"
#include "TemplateExporter.hpp"
#include "XlsxExporter.hpp"
#include "XmlExporter.hpp"
#include "YamlExporter.hpp"

#include <algorithm>
#include <cctype>

namespace pgexport {

namespace {

std::string normalize_name(const std::string& name) {
    std::string value = name;
    value.erase(0, value.find_first_not_of(" \t\n\r"));
    value.erase(value.find_last_not_of(" \t\n\r") + 1);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += items[i];
    }
    return out;
}

}  // namespace

void ExporterRegistry::register_exporter(const std::string& name, ExporterFactory factory) {
    std::string key = normalize_name(name);
    if (factories_.count(key) > 0) {
        throw ExportError("exporter: format \"" + key + "\" already registered");
    }
    factories_.emplace(key, std::move(factory));
}

std::unique_ptr<Exporter> ExporterRegistry::get(const std::string& name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        throw ConfigurationError("unsupported format: \"" + name + "\" (available: " + join(list(), ", ") + ")");
    }
    return it->second();
}

bool ExporterRegistry::contains(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> ExporterRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& entry : factories_) {
        names.push_back(entry.first);
    }
    return names;
}

void register_builtin_exporters(ExporterRegistry& registry) {
    registry.register_exporter(FORMAT_CSV, [] { return std::make_unique<CsvExporter>(); });
    registry.register_exporter(FORMAT_JSON, [] { return std::make_unique<JsonExporter>(); });
    registry.register_exporter(FORMAT_XML, [] { return std::make_unique<XmlExporter>(); });
    registry.register_exporter(FORMAT_YAML, [] { return std::make_unique<YamlExporter>(); });
    registry.register_exporter(FORMAT_SQL, [] { return std::make_unique<SqlExporter>(); });
    registry.register_exporter(FORMAT_XLSX, [] { return std::make_unique<XlsxExporter>(); });
    registry.register_exporter(FORMAT_TEMPLATE, [] { return std::make_unique<TemplateExporter>(); });
}

}  // namespace pgexport
