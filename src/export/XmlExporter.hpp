/**
 * @file XmlExporter.hpp
 * @brief Streaming XML document export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Exporter.hpp"

#include <string>

namespace pgexport {

/**
 * @brief One row element per row, one child element per column
 *
 * Layout (2 space indent):
 *
 *   <?xml version="1.0" encoding="UTF-8"?>
 *   <results>
 *     <row>
 *       <id>1</id>
 *       <note></note>
 *     </row>
 *   </results>
 *
 * NULL and empty values produce an explicit empty element. Values that
 * start with '{' or '[' are written unescaped so embedded JSON stays
 * parseable.
 */
class XmlExporter : public Exporter {
public:
    XmlExporter();

    std::size_t export_rows(Cursor& cursor, const ExportOptions& options) override;

private:
    Logger logger_;
};

/// Escape &, <, >, quotes and CR/LF/TAB for element content
std::string xml_escape(const std::string& text);

/**
 * @brief Turn a column name into a valid element name
 *
 * Characters outside [A-Za-z0-9_.-] (ASCII) are replaced by '_', and a
 * name that does not start with a letter or '_' gets a '_' prefix.
 */
std::string xml_element_name(const std::string& name);

}  // namespace pgexport
