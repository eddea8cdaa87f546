/**
 * @file TemplateExporter.hpp
 * @brief User-templated text export (full and streaming modes)
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Exporter.hpp"

#include <optional>
#include <string>
#include <vector>

#include <inja/inja.hpp>

namespace pgexport {

/**
 * @brief Renders rows through inja (Jinja2 syntax) templates
 *
 * Full mode buffers every row and renders ExportOptions::template_file
 * once with {Rows, Values, Columns, Count, GeneratedAt}. Rows holds one
 * object per row; Values holds the same rows as arrays in column order.
 *
 * Streaming mode renders template_header once with {Columns, GeneratedAt},
 * template_row once per row with {Row, Values, Columns, Index} and
 * template_footer once with {Columns, Count, GeneratedAt}. Only the row
 * template is mandatory.
 */
class TemplateExporter : public Exporter {
public:
    TemplateExporter();

    std::size_t export_rows(Cursor& cursor, const ExportOptions& options) override;

private:
    Logger logger_;

    std::size_t export_full(Cursor& cursor, const ExportOptions& options);
    std::size_t export_streaming(Cursor& cursor, const ExportOptions& options);
};

/**
 * @brief Register the helper functions available to every template
 *
 * get, title, trim, replace, join, split, contains, hasPrefix, hasSuffix,
 * json, jsonPretty, now, add, sub, mul, div, eq and ne. upper and lower
 * are inja builtins.
 *
 * @param columns Result columns; json and jsonPretty write row objects
 *        with their keys in this order
 */
void install_template_functions(inja::Environment& environment, std::vector<std::string> columns = {});

/**
 * @brief Read and parse a template file
 *
 * @return nullopt for a blank path when the template is optional
 * @throws ConfigurationError "template file path is empty" for a blank
 *         required path
 * @throws TemplateError on read and parse failures
 */
std::optional<inja::Template> load_template(inja::Environment& environment,
                                            const std::string& path,
                                            bool required);

}  // namespace pgexport
