/**
 * @file test_query_validator.cpp
 * @brief Read-only query checks
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <gtest/gtest.h>

#include "core/QueryValidator.hpp"

using namespace pgexport;

namespace {

std::string rejection(const std::string& query) {
    try {
        QueryValidator().validate(query);
    } catch (const QueryValidationError& e) {
        return e.what();
    }
    return "";
}

}  // namespace

TEST(QueryValidatorTest, AcceptsReadOnlyQueries) {
    QueryValidator validator;
    EXPECT_NO_THROW(validator.validate("SELECT * FROM users"));
    EXPECT_NO_THROW(validator.validate("  select id from t;  "));
    EXPECT_NO_THROW(validator.validate("WITH recent AS (SELECT * FROM orders) SELECT * FROM recent"));
    EXPECT_NO_THROW(validator.validate("SELECT created_at, updated_by FROM audit"));
    EXPECT_NO_THROW(validator.validate("SELECT 'DROP TABLE users' AS prank"));
    EXPECT_NO_THROW(validator.validate("-- nightly report\nSELECT 1"));
    EXPECT_NO_THROW(validator.validate("SELECT 1 /* ; DELETE FROM t */"));
}

TEST(QueryValidatorTest, RejectsEmptyInput) {
    EXPECT_EQ(rejection(""), "query cannot be empty");
    EXPECT_EQ(rejection("   \n\t"), "query cannot be empty");
    EXPECT_EQ(rejection("-- only a comment"),
              "unable to identify SQL command in statement 1 (security: unknown command)");
}

TEST(QueryValidatorTest, RejectsMultipleStatements) {
    EXPECT_EQ(rejection("SELECT 1; SELECT 2"), "only a single SQL statement is allowed");
    EXPECT_EQ(rejection("SELECT 1; DROP TABLE users"), "only a single SQL statement is allowed");
}

TEST(QueryValidatorTest, RejectsWriteCommands) {
    EXPECT_EQ(rejection("DELETE FROM users"), "forbidden SQL command detected: DELETE (read-only mode)");
    EXPECT_EQ(rejection("insert into t values (1)"), "forbidden SQL command detected: INSERT (read-only mode)");
    EXPECT_EQ(rejection("VACUUM"), "unsupported SQL command: VACUUM (only SELECT and WITH are allowed)");
}

TEST(QueryValidatorTest, RejectsEmbeddedWrites) {
    EXPECT_EQ(rejection("WITH gone AS (DELETE FROM t RETURNING *) SELECT * FROM gone"),
              "forbidden SQL command detected: DELETE (security: command found in query)");
    EXPECT_EQ(rejection("SELECT * FROM t WHERE id IN (SELECT id FROM x) OR update = 1"),
              "forbidden SQL command detected: UPDATE (security: command found in query)");
}

TEST(QueryValidatorTest, RemoveComments) {
    EXPECT_EQ(QueryValidator::remove_comments("SELECT 1 -- trailing\n"), "SELECT 1 \n");
    EXPECT_EQ(QueryValidator::remove_comments("SELECT /* x */ 2"), "SELECT  2");
    EXPECT_EQ(QueryValidator::remove_comments("SELECT '--not a comment'"), "SELECT '--not a comment'");
}

TEST(QueryValidatorTest, SplitStatements) {
    EXPECT_EQ(QueryValidator::split_statements("SELECT 1; SELECT ';'; "),
              (std::vector<std::string>{"SELECT 1", "SELECT ';'"}));
    EXPECT_TRUE(QueryValidator::split_statements(" ; ; ").empty());
}
