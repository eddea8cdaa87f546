/**
 * @file PgCursor.hpp
 * @brief Cursor over a libpq result streamed in single-row mode
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"
#include "../core/Logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <libpq-fe.h>

namespace pgexport {

struct PGresultDeleter {
    void operator()(PGresult* result) const { PQclear(result); }
};

using ResultPtr = std::unique_ptr<PGresult, PGresultDeleter>;

/**
 * @brief Forward-only cursor fed by PQgetResult()
 *
 * The query must already have been sent with PQsendQuery() and the
 * connection switched to single-row mode. The connection is borrowed and
 * must outlive the cursor. Destroying the cursor before exhaustion
 * cancels the query and drains the remaining results so the connection
 * can be reused.
 */
class PgCursor : public Cursor {
public:
    /**
     * @brief Fetch the first result to learn the column layout
     * @throws DatabaseError "query execution failed: ..." if the server rejects the query
     */
    explicit PgCursor(PGconn* connection);
    ~PgCursor() override;

    PgCursor(const PgCursor&) = delete;
    PgCursor& operator=(const PgCursor&) = delete;

    const std::vector<FieldDescriptor>& field_descriptors() const override { return fields_; }
    bool has_next() override;
    std::vector<Value> values() override;
    std::optional<std::string> error() const override { return error_; }

private:
    PGconn* connection_;
    ResultPtr current_;
    std::vector<FieldDescriptor> fields_;
    bool first_pending_ = false;
    bool done_ = false;
    std::optional<std::string> error_;
    Logger logger_;

    void drain();
};

/**
 * @brief Decode one text-format column value by type OID
 *
 * Unknown OIDs and values that do not parse are returned as strings.
 */
Value decode_value(std::uint32_t type_oid, const char* text, std::size_t length);

/// libpq error text without the trailing newline
std::string pq_message(const char* message);

}  // namespace pgexport
