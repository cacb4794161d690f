#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace pgtenant {

/**
 * @brief Bounded connection pool over any IConnectionFactory
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Lazy initialization: connections created on-demand up to max
 * - Health checking: validates connections idle longer than idle_timeout
 * - Lifetime recycling: connections older than max_lifetime are replaced
 * - Eviction: connections released with reusable=false are closed, never reused
 * - Session verification: when session_state_query is set, the probe result on
 *   release must equal the value captured at connection creation, otherwise
 *   the connection is evicted and a critical integrity event is logged
 * - RAII: PooledConnection auto-returns on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    size_t capacity() const override { return config_.max_connections; }

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    struct ConnectionMeta {
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
        std::string baseline_state;
    };

    /**
     * @brief Create new connection via factory and register its metadata
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Close a connection and forget its metadata
     */
    void destroy_connection(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Run session_state_query; empty optional if the probe failed
     */
    std::optional<std::string> probe_session_state(IDbConnection& conn) const;

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, ConnectionMeta> meta_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_evicted_{0};
    std::atomic<size_t> session_leaks_detected_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace pgtenant
