/**
 * @file XmlExporter.cpp
 * @brief Streaming XML document export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "XmlExporter.hpp"
#include "ValueFormatter.hpp"

#include <cctype>
#include <vector>

namespace pgexport {

namespace {

constexpr const char* XML_HEADER = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

bool is_name_start(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool is_name_char(unsigned char c) {
    return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
}

}  // namespace

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            case '\t': out += "&#x9;"; break;
            case '\n': out += "&#xA;"; break;
            case '\r': out += "&#xD;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string xml_element_name(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 1);
    for (char c : name) {
        out.push_back(is_name_char(static_cast<unsigned char>(c)) ? c : '_');
    }
    if (out.empty() || !is_name_start(static_cast<unsigned char>(out[0]))) {
        out.insert(out.begin(), '_');
    }
    return out;
}

XmlExporter::XmlExporter()
    : logger_("XmlExporter") {}

std::size_t XmlExporter::export_rows(Cursor& cursor, const ExportOptions& options) {
    std::string root = xml_element_name(options.xml_root_element.empty() ? "results" : options.xml_root_element);
    std::string row_tag = xml_element_name(options.xml_row_element.empty() ? "row" : options.xml_row_element);

    logger_.debug("Preparing XML export (indent=2 spaces, compression=" + options.compression + ")");

    ValueFormatter formatter(options.time_format, options.time_zone);
    ExportSession session(open_sink(options), logger_);

    session.write(XML_HEADER);
    session.write("<" + root + ">");
    logger_.debug("XML header written");

    const auto& fields = cursor.field_descriptors();
    std::vector<std::string> tags;
    tags.reserve(fields.size());
    for (const auto& field : fields) {
        std::string tag = xml_element_name(field.name);
        if (tag != field.name) {
            logger_.detailed("Column \"" + field.name + "\" written as element <" + tag + ">");
        }
        tags.push_back(std::move(tag));
    }

    ExportProgress progress(logger_);
    std::string chunk;

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        std::vector<Value> values = read_row(cursor, row_index);

        try {
            chunk.assign("\n  <" + row_tag + ">");
            for (std::size_t i = 0; i < values.size(); ++i) {
                std::string text = formatter.to_xml(values[i], fields[i].wire_type());
                chunk += "\n    <" + tags[i] + ">";
                if (!text.empty() && (text[0] == '{' || text[0] == '[')) {
                    chunk += text;
                } else {
                    chunk += xml_escape(text);
                }
                chunk += "</" + tags[i] + ">";
            }
            chunk += values.empty() ? "</" + row_tag + ">" : "\n  </" + row_tag + ">";
            session.write(chunk);
        } catch (const std::exception& e) {
            throw RowError("error writing row", row_index, e.what());
        }

        progress.row_written();
    }

    check_cursor(cursor, progress.rows());

    session.write(progress.rows() > 0 ? "\n</" + root + ">\n" : "</" + root + ">\n");
    session.finish();
    progress.log_completed("XML");
    return progress.rows();
}

}  // namespace pgexport
