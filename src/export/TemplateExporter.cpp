/**
 * @file TemplateExporter.cpp
 * @brief User-templated text export (full and streaming modes)
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TemplateExporter.hpp"
#include "RowEncoders.hpp"
#include "ValueFormatter.hpp"
#include "../core/TimeLayout.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

namespace pgexport {

namespace {

using ordered_json = nlohmann::ordered_json;

bool is_blank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\n\r\f\v");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(begin, end - begin + 1);
}

std::string title_case(const std::string& text) {
    std::string out = text;
    bool word_start = true;
    for (char& c : out) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            word_start = true;
            continue;
        }
        c = static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
        word_start = false;
    }
    return out;
}

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

json split(const std::string& text, const std::string& separator) {
    json parts = json::array();
    if (separator.empty()) {
        // One element per UTF-8 character
        for (std::size_t i = 0; i < text.size();) {
            std::size_t length = 1;
            auto lead = static_cast<unsigned char>(text[i]);
            if ((lead & 0xE0) == 0xC0) length = 2;
            else if ((lead & 0xF0) == 0xE0) length = 3;
            else if ((lead & 0xF8) == 0xF0) length = 4;
            parts.push_back(text.substr(i, length));
            i += length;
        }
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        std::size_t pos = text.find(separator, start);
        parts.push_back(text.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + separator.size();
    }
    return parts;
}

std::string join(const json& items, const std::string& separator) {
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += separator;
        out += item.is_string() ? item.get<std::string>() : json_scalar_text(item);
        first = false;
    }
    return out;
}

const std::string& text_arg(const inja::Arguments& args, std::size_t index) {
    return args.at(index)->get_ref<const std::string&>();
}

std::int64_t int_arg(const inja::Arguments& args, std::size_t index) {
    return args.at(index)->get<std::int64_t>();
}

std::string read_file(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw TemplateError("error reading template file \"" + path + "\": " + std::strerror(errno));
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

json row_object(const OrderedRow& row, const ValueFormatter& formatter) {
    json object = json::object();
    for (std::size_t i = 0; i < row.size(); ++i) {
        // First occurrence wins, matching OrderedRow::find
        if (!object.contains(row.key(i))) {
            object[row.key(i)] = formatter.to_template(row.value(i), row.type(i));
        }
    }
    return object;
}

json row_values(const OrderedRow& row, const ValueFormatter& formatter) {
    json values = json::array();
    for (std::size_t i = 0; i < row.size(); ++i) {
        values.push_back(formatter.to_template(row.value(i), row.type(i)));
    }
    return values;
}

/**
 * @brief Result columns in query order, used to re-order row objects
 *
 * An object is taken to be a row when its keys are exactly the distinct
 * column names.
 */
struct ColumnOrder {
    std::vector<std::string> names;
    std::size_t distinct = 0;

    explicit ColumnOrder(std::vector<std::string> columns) : names(std::move(columns)) {
        std::vector<std::string> sorted = names;
        std::sort(sorted.begin(), sorted.end());
        distinct = static_cast<std::size_t>(std::unique(sorted.begin(), sorted.end()) - sorted.begin());
    }

    bool is_row(const json& object) const {
        if (names.empty() || object.size() != distinct) return false;
        for (const auto& name : names) {
            if (!object.contains(name)) return false;
        }
        return true;
    }
};

ordered_json to_ordered(const json& value, const ColumnOrder& order) {
    switch (value.type()) {
        case json::value_t::object: {
            ordered_json out = ordered_json::object();
            if (order.is_row(value)) {
                for (const auto& name : order.names) {
                    if (!out.contains(name)) out[name] = to_ordered(value.at(name), order);
                }
            } else {
                for (auto it = value.begin(); it != value.end(); ++it) {
                    out[it.key()] = to_ordered(it.value(), order);
                }
            }
            return out;
        }
        case json::value_t::array: {
            ordered_json out = ordered_json::array();
            for (const auto& element : value) {
                out.push_back(to_ordered(element, order));
            }
            return out;
        }
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
            return value.get<std::int64_t>();
        case json::value_t::number_unsigned:
            return value.get<std::uint64_t>();
        case json::value_t::number_float:
            return value.get<double>();
        case json::value_t::string:
            return value.get<std::string>();
        default:
            return nullptr;
    }
}

}  // namespace

void install_template_functions(inja::Environment& environment, std::vector<std::string> columns) {
    auto order = std::make_shared<const ColumnOrder>(std::move(columns));

    environment.add_callback("get", 2, [](inja::Arguments& args) -> json {
        const json& row = *args.at(0);
        const std::string& key = text_arg(args, 1);
        if (row.is_object()) {
            auto it = row.find(key);
            if (it != row.end()) return *it;
        }
        return nullptr;
    });
    environment.add_callback("title", 1, [](inja::Arguments& args) -> json {
        return title_case(text_arg(args, 0));
    });
    environment.add_callback("trim", 1, [](inja::Arguments& args) -> json {
        return trim(text_arg(args, 0));
    });
    environment.add_callback("replace", 3, [](inja::Arguments& args) -> json {
        return replace_all(text_arg(args, 0), text_arg(args, 1), text_arg(args, 2));
    });
    environment.add_callback("join", 2, [](inja::Arguments& args) -> json {
        return join(*args.at(0), text_arg(args, 1));
    });
    environment.add_callback("split", 2, [](inja::Arguments& args) -> json {
        return split(text_arg(args, 0), text_arg(args, 1));
    });
    environment.add_callback("contains", 2, [](inja::Arguments& args) -> json {
        return text_arg(args, 0).find(text_arg(args, 1)) != std::string::npos;
    });
    environment.add_callback("hasPrefix", 2, [](inja::Arguments& args) -> json {
        return text_arg(args, 0).starts_with(text_arg(args, 1));
    });
    environment.add_callback("hasSuffix", 2, [](inja::Arguments& args) -> json {
        return text_arg(args, 0).ends_with(text_arg(args, 1));
    });
    environment.add_callback("json", 1, [order](inja::Arguments& args) -> json {
        return to_ordered(*args.at(0), *order).dump(-1, ' ', false, json::error_handler_t::replace);
    });
    environment.add_callback("jsonPretty", 1, [order](inja::Arguments& args) -> json {
        return to_ordered(*args.at(0), *order).dump(2, ' ', false, json::error_handler_t::replace);
    });
    environment.add_callback("now", 0, [](inja::Arguments&) -> json {
        return now_rfc3339();
    });
    environment.add_callback("add", 2, [](inja::Arguments& args) -> json {
        return int_arg(args, 0) + int_arg(args, 1);
    });
    environment.add_callback("sub", 2, [](inja::Arguments& args) -> json {
        return int_arg(args, 0) - int_arg(args, 1);
    });
    environment.add_callback("mul", 2, [](inja::Arguments& args) -> json {
        return int_arg(args, 0) * int_arg(args, 1);
    });
    environment.add_callback("div", 2, [](inja::Arguments& args) -> json {
        std::int64_t divisor = int_arg(args, 1);
        return divisor == 0 ? std::int64_t{0} : int_arg(args, 0) / divisor;
    });
    environment.add_callback("eq", 2, [](inja::Arguments& args) -> json {
        return *args.at(0) == *args.at(1);
    });
    environment.add_callback("ne", 2, [](inja::Arguments& args) -> json {
        return *args.at(0) != *args.at(1);
    });
}

std::optional<inja::Template> load_template(inja::Environment& environment,
                                            const std::string& path,
                                            bool required) {
    if (is_blank(path)) {
        if (required) {
            throw ConfigurationError("template file path is empty");
        }
        return std::nullopt;
    }

    std::string source = read_file(path);
    try {
        return environment.parse(source);
    } catch (const inja::InjaError& e) {
        throw TemplateError("error parsing template \"" + path + "\": " + e.what());
    }
}

TemplateExporter::TemplateExporter()
    : logger_("TemplateExporter") {}

std::size_t TemplateExporter::export_rows(Cursor& cursor, const ExportOptions& options) {
    if (options.template_streaming) {
        return export_streaming(cursor, options);
    }
    return export_full(cursor, options);
}

std::size_t TemplateExporter::export_full(Cursor& cursor, const ExportOptions& options) {
    logger_.debug("Preparing TEMPLATE (full mode) export (compression=" + options.compression + ")");

    const auto& fields = cursor.field_descriptors();

    inja::Environment environment;
    install_template_functions(environment, column_names(fields));
    inja::Template full = *load_template(environment, options.template_file, true);

    ValueFormatter formatter(options.time_format, options.time_zone);
    ExportSession session(open_sink(options), logger_);

    json rows = json::array();
    json values = json::array();
    ExportProgress progress(logger_);

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        OrderedRow row(fields, read_row(cursor, row_index));
        try {
            rows.push_back(row_object(row, formatter));
            values.push_back(row_values(row, formatter));
        } catch (const std::exception& e) {
            throw RowError("error reading row", row_index, e.what());
        }
        progress.row_written();
    }

    check_cursor(cursor, progress.rows());

    json data;
    data["Rows"] = std::move(rows);
    data["Values"] = std::move(values);
    data["Columns"] = column_names(fields);
    data["Count"] = progress.rows();
    data["GeneratedAt"] = now_rfc3339();

    std::string rendered;
    try {
        rendered = environment.render(full, data);
    } catch (const std::exception& e) {
        throw TemplateError(std::string("error executing template: ") + e.what(), progress.rows());
    }

    session.write(rendered);
    session.finish();
    progress.log_completed("TEMPLATE full");
    return progress.rows();
}

std::size_t TemplateExporter::export_streaming(Cursor& cursor, const ExportOptions& options) {
    logger_.debug("Preparing TEMPLATE (streaming mode) export (compression=" + options.compression + ")");

    const auto& fields = cursor.field_descriptors();

    inja::Environment environment;
    install_template_functions(environment, column_names(fields));
    std::optional<inja::Template> header = load_template(environment, options.template_header, false);
    inja::Template row_template = *load_template(environment, options.template_row, true);
    std::optional<inja::Template> footer = load_template(environment, options.template_footer, false);

    ValueFormatter formatter(options.time_format, options.time_zone);
    ExportSession session(open_sink(options), logger_);

    json columns = column_names(fields);
    std::string generated_at = now_rfc3339();

    if (header) {
        json data;
        data["Columns"] = columns;
        data["GeneratedAt"] = generated_at;
        std::string rendered;
        try {
            rendered = environment.render(*header, data);
        } catch (const std::exception& e) {
            throw TemplateError(std::string("error executing header template: ") + e.what());
        }
        session.write(rendered);
    }

    ExportProgress progress(logger_);

    while (cursor.has_next()) {
        std::size_t row_index = progress.rows() + 1;
        OrderedRow row(fields, read_row(cursor, row_index));

        json data;
        std::string rendered;
        try {
            data["Row"] = row_object(row, formatter);
            data["Values"] = row_values(row, formatter);
            data["Columns"] = columns;
            data["Index"] = row_index;
            rendered = environment.render(row_template, data);
        } catch (const std::exception& e) {
            throw TemplateError("error executing row template for row " + std::to_string(row_index) + ": " +
                                e.what(), row_index - 1);
        }
        try {
            session.write(rendered);
        } catch (const std::exception& e) {
            throw RowError("error writing row", row_index, e.what());
        }

        progress.row_written();
    }

    check_cursor(cursor, progress.rows());

    if (footer) {
        json data;
        data["Columns"] = columns;
        data["Count"] = progress.rows();
        data["GeneratedAt"] = generated_at;
        std::string rendered;
        try {
            rendered = environment.render(*footer, data);
        } catch (const std::exception& e) {
            throw TemplateError(std::string("error executing footer template: ") + e.what(), progress.rows());
        }
        session.write(rendered);
    }

    session.finish();
    progress.log_completed("TEMPLATE streaming");
    return progress.rows();
}

}  // namespace pgexport
