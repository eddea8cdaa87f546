/**
 * @file QueryValidator.hpp
 * @brief Read-only safety check applied to a query before it is executed
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"
#include "Logger.hpp"

#include <string>
#include <vector>

namespace pgexport {

/**
 * @brief Accepts a single SELECT or WITH statement and nothing else
 *
 * Comments are stripped first and string literals are ignored, so
 * "SELECT 'DROP TABLE x'" passes while "SELECT 1; DROP TABLE x" and
 * "WITH d AS (DELETE FROM t RETURNING *) SELECT * FROM d" do not.
 */
class QueryValidator {
public:
    static const std::vector<std::string>& forbidden_commands();

    QueryValidator();

    /// @throws QueryValidationError describing the first violation found
    void validate(const std::string& query) const;

    /// Query text with -- and block comments removed (string literals kept)
    static std::string remove_comments(const std::string& query);

    /// Non-empty statements separated by ';' outside string literals
    static std::vector<std::string> split_statements(const std::string& query);

private:
    Logger logger_;
};

}  // namespace pgexport
