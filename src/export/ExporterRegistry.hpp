/**
 * @file ExporterRegistry.hpp
 * @brief Format name to exporter factory table
 *
 * Filled once at startup by register_builtin_exporters() and only read
 * afterwards.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Exporter.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pgexport {

using ExporterFactory = std::function<std::unique_ptr<Exporter>()>;

class ExporterRegistry {
public:
    /**
     * @brief Add a format
     *
     * The name is trimmed and lower-cased.
     *
     * @throws ExportError if the name is already registered
     */
    void register_exporter(const std::string& name, ExporterFactory factory);

    /**
     * @brief New exporter instance for a format
     * @throws ConfigurationError listing the available formats
     */
    std::unique_ptr<Exporter> get(const std::string& name) const;

    bool contains(const std::string& name) const;

    /// Registered names, sorted ascending
    std::vector<std::string> list() const;

private:
    std::map<std::string, ExporterFactory> factories_;
};

/**
 * @brief Register csv, json, xml, yaml, sql, xlsx and template
 */
void register_builtin_exporters(ExporterRegistry& registry);

}  // namespace pgexport
