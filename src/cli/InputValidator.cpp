/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "InputValidator.hpp"
#include <sstream>

namespace pgexport {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "Contradictory parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const CommandLineConfig& config) const {
    ValidationResult result;
    result.is_valid = true;

    for (auto conflict : {check_verbosity_flags(config),
                          check_query_source(config),
                          check_template_mode(config),
                          check_copy_format(config)}) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_verbosity_flags(
    const CommandLineConfig& config) const {

    if (!config.verbose || !config.quiet) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Cannot use --verbose and --quiet flags together";
    conflict.involved_params = {"--verbose (-v)", "--quiet (-q)"};
    conflict.suggestions = {
        "Remove --quiet to see debugging output",
        "Remove --verbose to see errors only"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_query_source(
    const CommandLineConfig& config) const {

    if (config.sql.empty() || config.sql_file.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Cannot use both --sql and --sqlfile at the same time";
    conflict.involved_params = {"--sql (-s)", "--sqlfile (-F) = " + config.sql_file};
    conflict.suggestions = {
        "Pass the query inline with --sql",
        "Put the query in a file and pass it with --sqlfile"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_template_mode(
    const CommandLineConfig& config) const {

    const auto& options = config.options;
    if (options.format != FORMAT_TEMPLATE || options.template_file.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> streaming;
    if (!options.template_header.empty()) streaming.push_back("--tpl-header = " + options.template_header);
    if (!options.template_row.empty()) streaming.push_back("--tpl-row = " + options.template_row);
    if (!options.template_footer.empty()) streaming.push_back("--tpl-footer = " + options.template_footer);
    if (streaming.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description =
        "template export error: use either --tpl-file (full mode) OR --tpl-row (streaming mode), not both";
    conflict.involved_params.push_back("--tpl-file = " + options.template_file);
    conflict.involved_params.insert(conflict.involved_params.end(), streaming.begin(), streaming.end());
    conflict.suggestions = {
        "Remove --tpl-file to render row by row",
        "Remove --tpl-header, --tpl-row and --tpl-footer to render the whole result at once"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_copy_format(
    const CommandLineConfig& config) const {

    if (!config.with_copy || config.options.format == FORMAT_CSV) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "format " + config.options.format + " does not support COPY mode";
    conflict.involved_params = {"--with-copy", "--format (-f) = " + config.options.format};
    conflict.suggestions = {
        "Remove --with-copy",
        "Use --format csv"
    };
    return conflict;
}

} // namespace pgexport
