/**
 * @file YamlExporter.hpp
 * @brief YAML sequence-of-mappings export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Exporter.hpp"

namespace pgexport {

/**
 * @brief Builds one mapping per row and emits the whole sequence at the end
 *
 * Unlike the streaming formats this holds the full result in memory
 * until the cursor is exhausted.
 */
class YamlExporter : public Exporter {
public:
    YamlExporter();

    std::size_t export_rows(Cursor& cursor, const ExportOptions& options) override;

private:
    Logger logger_;
};

}  // namespace pgexport
