/**
 * @file JsonExporter.hpp
 * @brief Streaming JSON array export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Exporter.hpp"

namespace pgexport {

/**
 * @brief Writes one top-level array, one object per row, in cursor order
 *
 * Rows are encoded and written as they arrive; the result set is never
 * held in memory.
 */
class JsonExporter : public Exporter {
public:
    JsonExporter();

    std::size_t export_rows(Cursor& cursor, const ExportOptions& options) override;

private:
    Logger logger_;
};

}  // namespace pgexport
