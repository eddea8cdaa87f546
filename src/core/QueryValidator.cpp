/**
 * @file QueryValidator.cpp
 * @brief Read-only safety check applied to a query before it is executed
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "QueryValidator.hpp"

#include <cctype>

namespace pgexport {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\n\r\f\v");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(begin, end - begin + 1);
}

/// Upper-case and collapse whitespace runs into single spaces
std::string normalize(const std::string& statement) {
    std::string out;
    out.reserve(statement.size());
    bool pending_space = false;
    for (char c : trim(statement)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string first_command(const std::string& normalized) {
    if (normalized.starts_with("WITH ")) {
        return "WITH";
    }
    std::size_t end = 0;
    while (end < normalized.size() && is_word_char(normalized[end])) {
        ++end;
    }
    return normalized.substr(0, end);
}

/// Replace quoted literals and identifiers (quotes included) with spaces
std::string blank_quoted(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote == 0) {
            if (c == '\'' || c == '"') {
                quote = c;
                out.push_back(' ');
            } else {
                out.push_back(c);
            }
            continue;
        }
        if (c == quote) {
            if (i + 1 < text.size() && text[i + 1] == quote) {
                ++i;
                continue;
            }
            quote = 0;
        }
        out.push_back(' ');
    }
    return out;
}

bool contains_word(const std::string& text, const std::string& word) {
    std::size_t pos = 0;
    while ((pos = text.find(word, pos)) != std::string::npos) {
        bool left = pos == 0 || !is_word_char(text[pos - 1]);
        std::size_t after = pos + word.size();
        bool right = after >= text.size() || !is_word_char(text[after]);
        if (left && right) {
            return true;
        }
        pos = after;
    }
    return false;
}

}  // namespace

const std::vector<std::string>& QueryValidator::forbidden_commands() {
    static const std::vector<std::string> commands = {
        "DELETE", "DROP", "TRUNCATE", "INSERT", "UPDATE", "ALTER", "CREATE",
        "GRANT", "REVOKE", "EXECUTE", "EXEC", "CALL", "MERGE", "COPY"
    };
    return commands;
}

QueryValidator::QueryValidator()
    : logger_("QueryValidator") {}

std::string QueryValidator::remove_comments(const std::string& query) {
    std::string out;
    out.reserve(query.size());

    bool line_comment = false;
    bool block_comment = false;
    char quote = 0;

    for (std::size_t i = 0; i < query.size(); ++i) {
        char c = query[i];
        char next = i + 1 < query.size() ? query[i + 1] : '\0';

        if (line_comment) {
            if (c == '\n') {
                line_comment = false;
                out.push_back(c);
            }
            continue;
        }
        if (block_comment) {
            if (c == '*' && next == '/') {
                block_comment = false;
                ++i;
            }
            continue;
        }

        if (quote != 0) {
            out.push_back(c);
            if (c == quote) {
                if (next == quote) {
                    out.push_back(next);
                    ++i;
                } else {
                    quote = 0;
                }
            }
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            out.push_back(c);
        } else if (c == '-' && next == '-') {
            line_comment = true;
            ++i;
        } else if (c == '/' && next == '*') {
            block_comment = true;
            ++i;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> QueryValidator::split_statements(const std::string& query) {
    std::vector<std::string> statements;
    std::string current;
    char quote = 0;

    auto push_current = [&]() {
        std::string statement = trim(current);
        if (!statement.empty()) {
            statements.push_back(statement);
        }
        current.clear();
    };

    for (std::size_t i = 0; i < query.size(); ++i) {
        char c = query[i];
        if (quote != 0) {
            current.push_back(c);
            if (c == quote) {
                if (i + 1 < query.size() && query[i + 1] == quote) {
                    current.push_back(query[++i]);
                } else {
                    quote = 0;
                }
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            current.push_back(c);
        } else if (c == ';') {
            push_current();
        } else {
            current.push_back(c);
        }
    }
    push_current();
    return statements;
}

void QueryValidator::validate(const std::string& query) const {
    if (trim(query).empty()) {
        throw QueryValidationError("query cannot be empty");
    }

    std::vector<std::string> statements = split_statements(remove_comments(query));
    if (statements.size() > 1) {
        throw QueryValidationError("only a single SQL statement is allowed");
    }

    if (statements.empty()) {
        throw QueryValidationError("unable to identify SQL command in statement 1 (security: unknown command)");
    }

    std::string normalized = normalize(statements.front());
    std::string command = first_command(normalized);
    logger_.trace("First SQL command: \"" + command + "\"");

    if (command.empty()) {
        throw QueryValidationError("unable to identify SQL command in statement 1 (security: unknown command)");
    }

    if (command != "SELECT" && command != "WITH") {
        for (const auto& forbidden : forbidden_commands()) {
            if (command == forbidden) {
                throw QueryValidationError("forbidden SQL command detected: " + forbidden + " (read-only mode)");
            }
        }
        throw QueryValidationError("unsupported SQL command: " + command + " (only SELECT and WITH are allowed)");
    }

    std::string unquoted = blank_quoted(normalized);
    for (const auto& forbidden : forbidden_commands()) {
        if (contains_word(unquoted, forbidden)) {
            throw QueryValidationError("forbidden SQL command detected: " + forbidden +
                                       " (security: command found in query)");
        }
    }

    logger_.detailed("Query passed read-only validation");
}

}  // namespace pgexport
