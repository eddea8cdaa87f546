/**
 * @file Store.hpp
 * @brief Database access used by the export run
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"
#include "../export/Exporter.hpp"

#include <functional>
#include <memory>
#include <string>

namespace pgexport {

/**
 * @brief A connection that can run one query or one COPY at a time
 */
class Store : public CopySource {
public:
    ~Store() override = default;

    /// @throws DatabaseError
    virtual void connect() = 0;

    virtual void close() = 0;

    /**
     * @brief Start a query; the cursor must be destroyed before the store
     * @throws DatabaseError
     */
    virtual std::unique_ptr<Cursor> query(const std::string& sql) = 0;
};

using StoreFactory = std::function<std::unique_ptr<Store>(const std::string& dsn)>;

}  // namespace pgexport
