/**
 * @file PgStore.cpp
 * @brief PostgreSQL connection, query execution and COPY OUT via libpq
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PgStore.hpp"

#include <chrono>
#include <cstdlib>

namespace pgexport {

namespace {

struct CopyBufferDeleter {
    void operator()(char* buffer) const { PQfreemem(buffer); }
};

std::string sanitize_keyword_dsn(const std::string& dsn) {
    std::string out = dsn;
    const std::string key = "password";
    std::size_t pos = 0;
    while ((pos = out.find(key, pos)) != std::string::npos) {
        std::size_t cursor = pos + key.size();
        while (cursor < out.size() && out[cursor] == ' ') ++cursor;
        if (cursor >= out.size() || out[cursor] != '=') {
            pos = cursor;
            continue;
        }
        ++cursor;
        while (cursor < out.size() && out[cursor] == ' ') ++cursor;

        std::size_t end = cursor;
        if (end < out.size() && out[end] == '\'') {
            ++end;
            while (end < out.size() && out[end] != '\'') {
                if (out[end] == '\\') ++end;
                ++end;
            }
            end = std::min(end + 1, out.size());
        } else {
            while (end < out.size() && out[end] != ' ') ++end;
        }
        out.replace(cursor, end - cursor, "***");
        pos = cursor + 3;
    }
    return out;
}

}  // namespace

std::string sanitize_dsn(const std::string& dsn) {
    auto scheme_end = dsn.find("://");
    if (scheme_end == std::string::npos) {
        return sanitize_keyword_dsn(dsn);
    }

    std::string scheme = dsn.substr(0, scheme_end);
    std::string rest = dsn.substr(scheme_end + 3);

    auto query = rest.find_first_of("?#");
    if (query != std::string::npos) {
        rest.erase(query);
    }

    auto slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "/" : rest.substr(slash);

    std::string user_info;
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string credentials = authority.substr(0, at);
        authority.erase(0, at + 1);
        auto colon = credentials.find(':');
        user_info = colon == std::string::npos ? credentials + "@" : credentials.substr(0, colon) + ":***@";
    }

    return scheme + "://" + user_info + authority + path;
}

PgStore::PgStore(std::string dsn)
    : dsn_(std::move(dsn)), logger_("PgStore") {}

PgStore::~PgStore() {
    close();
}

void PgStore::connect() {
    if (connection_ != nullptr) {
        return;
    }

    logger_.debug("Attempting to connect to database host: " + sanitize_dsn(dsn_));

    PGconn* connection = PQconnectdb(dsn_.c_str());
    if (connection == nullptr) {
        throw DatabaseError("unable to connect to database: out of memory");
    }
    if (PQstatus(connection) != CONNECTION_OK) {
        std::string message = pq_message(PQerrorMessage(connection));
        PQfinish(connection);
        throw DatabaseError("unable to connect to database: " + message);
    }

    logger_.debug("Connection established, verifying connectivity (ping)...");

    ResultPtr ping(PQexec(connection, "SELECT 1"));
    if (!ping || PQresultStatus(ping.get()) != PGRES_TUPLES_OK) {
        std::string message = pq_message(ping ? PQresultErrorMessage(ping.get()) : PQerrorMessage(connection));
        ping.reset();
        PQfinish(connection);
        throw DatabaseError("unable to ping database: " + message);
    }

    logger_.debug("Database ping successful");

    ResultPtr setup(PQexec(connection, SESSION_SETUP_SQL));
    if (!setup || PQresultStatus(setup.get()) != PGRES_COMMAND_OK) {
        std::string message = pq_message(setup ? PQresultErrorMessage(setup.get()) : PQerrorMessage(connection));
        setup.reset();
        PQfinish(connection);
        throw DatabaseError("unable to configure session: " + message);
    }

    connection_ = connection;
}

void PgStore::close() {
    if (connection_ == nullptr) {
        return;
    }
    logger_.debug("Closing database connection...");
    PQfinish(connection_);
    connection_ = nullptr;
    logger_.debug("Database connection closed successfully");
}

std::unique_ptr<Cursor> PgStore::query(const std::string& sql) {
    if (connection_ == nullptr) {
        logger_.debug("No active database connection; query cannot be executed");
        throw DatabaseError("database not connected");
    }

    logger_.debug("Executing SQL query...");
    logger_.trace("Query: " + sql);

    auto start = std::chrono::steady_clock::now();
    if (PQsendQuery(connection_, sql.c_str()) == 0) {
        throw DatabaseError("query execution failed: " + pq_message(PQerrorMessage(connection_)));
    }
    if (PQsetSingleRowMode(connection_) == 0) {
        cancel_and_drain();
        throw DatabaseError("query execution failed: unable to enable single-row mode");
    }

    auto cursor = std::make_unique<PgCursor>(connection_);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    logger_.debug("Query executed successfully in " + std::to_string(elapsed) + "s");
    return cursor;
}

std::uint64_t PgStore::copy_to(const std::string& copy_sql, const ChunkHandler& handler) {
    if (connection_ == nullptr) {
        throw DatabaseError("database not connected");
    }

    logger_.trace("COPY statement: " + copy_sql);

    ResultPtr start(PQexec(connection_, copy_sql.c_str()));
    if (!start || PQresultStatus(start.get()) != PGRES_COPY_OUT) {
        std::string message = pq_message(start ? PQresultErrorMessage(start.get()) : PQerrorMessage(connection_));
        start.reset();
        cancel_and_drain();
        throw DatabaseError(message);
    }
    start.reset();

    try {
        while (true) {
            char* raw = nullptr;
            int size = PQgetCopyData(connection_, &raw, 0);
            if (size == -1) {
                break;
            }
            if (size == -2) {
                throw DatabaseError(pq_message(PQerrorMessage(connection_)));
            }
            std::unique_ptr<char, CopyBufferDeleter> buffer(raw);
            handler(buffer.get(), static_cast<std::size_t>(size));
        }
    } catch (const std::exception&) {
        cancel_and_drain();
        throw;
    }

    ResultPtr finish(PQgetResult(connection_));
    if (!finish || PQresultStatus(finish.get()) != PGRES_COMMAND_OK) {
        std::string message = pq_message(finish ? PQresultErrorMessage(finish.get()) : PQerrorMessage(connection_));
        finish.reset();
        cancel_and_drain();
        throw DatabaseError(message);
    }

    std::uint64_t rows = std::strtoull(PQcmdTuples(finish.get()), nullptr, 10);
    finish.reset();
    cancel_and_drain();
    return rows;
}

void PgStore::cancel_and_drain() {
    if (PQtransactionStatus(connection_) == PQTRANS_ACTIVE) {
        PGcancel* cancel = PQgetCancel(connection_);
        if (cancel != nullptr) {
            char buffer[256];
            if (PQcancel(cancel, buffer, sizeof(buffer)) == 0) {
                logger_.warning(std::string("Failed to cancel query: ") + buffer);
            }
            PQfreeCancel(cancel);
        }
    }
    while (PGresult* result = PQgetResult(connection_)) {
        PQclear(result);
    }
}

}  // namespace pgexport
