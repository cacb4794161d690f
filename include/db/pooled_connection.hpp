#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace pgtenant {

/**
 * @brief RAII wrapper for database connection
 *
 * Automatically returns connection to pool on destruction.
 * Move-only to prevent accidental copying.
 *
 * A connection whose session state could not be restored is marked with
 * discard(); the pool then closes it instead of handing it out again.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function to call on destruction (returns to pool)
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    /**
     * @brief Destructor - automatically returns connection to pool
     */
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    /**
     * @brief Access the underlying connection
     */
    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    /**
     * @brief Check if connection is valid
     */
    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Mark the connection unfit for reuse; the pool evicts it on release
     */
    void discard() { reusable_ = false; }

    bool is_reusable() const { return reusable_; }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool reusable_ = true;
};

} // namespace pgtenant
