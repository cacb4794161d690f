#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace pgtenant {

class SchemaContext;
class TenantRegistry;

enum class BindMode {
    ACTIVE_ONLY,        // Request path: shared schema or an ACTIVE tenant
    ADMINISTRATIVE      // Lifecycle/migration: also PROVISIONING and SUSPENDED tenants
};

/**
 * @brief RAII session search_path binding on one connection
 *
 * bind() captures the connection's current search_path and replaces it;
 * restore() (or the destructor) puts the captured value back, rolling back
 * any transaction the operation left open first. Guards nest: an inner guard
 * restores the outer guard's path.
 *
 * A guard bound inside an open transaction owns a savepoint instead. Its
 * restore releases the savepoint, or rolls back to it when a statement
 * failed under the binding, and never ends the caller's transaction.
 *
 * If the restore cannot be completed the connection is discarded so the pool
 * evicts it instead of handing a tenant-bound session to the next caller.
 */
class SearchPathGuard {
public:
    [[nodiscard]] static Result<SearchPathGuard> bind(PooledConnection& conn,
                                                      const std::string& search_path);

    ~SearchPathGuard();

    SearchPathGuard(SearchPathGuard&& other) noexcept;
    SearchPathGuard& operator=(SearchPathGuard&&) = delete;
    SearchPathGuard(const SearchPathGuard&) = delete;
    SearchPathGuard& operator=(const SearchPathGuard&) = delete;

    /**
     * @brief Restore the captured search_path; idempotent
     * @return CONNECTION_LEAK_DETECTED if the session could not be restored
     */
    [[nodiscard]] Status restore();

    [[nodiscard]] const std::string& previous() const { return previous_; }

private:
    SearchPathGuard(PooledConnection& conn, std::string previous, std::string savepoint);

    [[nodiscard]] Status restore_to_savepoint(PooledConnection& conn);

    PooledConnection* conn_;
    std::string previous_;
    std::string savepoint_;     // Empty unless bound inside a transaction
};

/**
 * @brief Binds a schema onto pooled connections around a unit of work
 *
 * with_schema() acquires a connection, binds the schema, runs the operation
 * and restores the session on every exit path before the connection goes
 * back to the pool. The operation receives the bound connection and must
 * return a Result<...>; exceptions propagate after the restore.
 */
class ConnectionSchemaBinder {
public:
    struct Config {
        std::string shared_schema = "public";
        bool include_shared_in_search_path = true;
        std::chrono::milliseconds acquire_timeout{5000};
    };

    struct Stats {
        uint64_t binds = 0;
        uint64_t bind_failures = 0;
        uint64_t rejected = 0;      // SCHEMA_NOT_FOUND / NO_ACTIVE_SCHEMA
    };

    ConnectionSchemaBinder(std::shared_ptr<IConnectionPool> pool,
                           std::shared_ptr<const TenantRegistry> registry,
                           Config config);

    /**
     * @brief Fail with SCHEMA_NOT_FOUND unless schema_name may be bound in mode
     */
    [[nodiscard]] Status check_bindable(const std::string& schema_name, BindMode mode) const;

    /**
     * @brief search_path value used for schema_name
     */
    [[nodiscard]] std::string search_path_for(const std::string& schema_name) const;

    template<typename Op>
    auto with_schema(const std::string& schema_name, Op&& op,
                     BindMode mode = BindMode::ACTIVE_ONLY)
        -> std::invoke_result_t<Op, IDbConnection&>;

    /**
     * @brief Bind the context's current schema; NO_ACTIVE_SCHEMA when unset
     */
    template<typename Op>
    auto with_context(const SchemaContext& context, Op&& op)
        -> std::invoke_result_t<Op, IDbConnection&>;

    /**
     * @brief Nested binding on a connection the caller already holds
     */
    [[nodiscard]] Result<SearchPathGuard> bind_nested(PooledConnection& conn,
                                                      const std::string& schema_name,
                                                      BindMode mode = BindMode::ACTIVE_ONLY) const;

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const std::shared_ptr<IConnectionPool>& pool() const { return pool_; }

private:
    // SchemaContext is only forward-declared in this header
    [[nodiscard]] std::optional<std::string> current_of(const SchemaContext& context) const;

    std::shared_ptr<IConnectionPool> pool_;
    std::shared_ptr<const TenantRegistry> registry_;
    Config config_;

    mutable std::atomic<uint64_t> binds_{0};
    mutable std::atomic<uint64_t> bind_failures_{0};
    mutable std::atomic<uint64_t> rejected_{0};
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename Op>
auto ConnectionSchemaBinder::with_schema(const std::string& schema_name, Op&& op, BindMode mode)
    -> std::invoke_result_t<Op, IDbConnection&> {
    using R = std::invoke_result_t<Op, IDbConnection&>;

    const auto allowed = check_bindable(schema_name, mode);
    if (allowed.is_error()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return R::from_error(allowed);
    }

    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        bind_failures_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCode::POOL_EXHAUSTED,
            std::format("no connection available to bind schema '{}'", schema_name));
    }

    // Declared after conn: the guard restores before the connection is released
    auto guard = SearchPathGuard::bind(*conn, search_path_for(schema_name));
    if (guard.is_error()) {
        bind_failures_.fetch_add(1, std::memory_order_relaxed);
        return R::from_error(guard);
    }
    binds_.fetch_add(1, std::memory_order_relaxed);

    R result = std::forward<Op>(op)(**conn);

    // A failed restore is fatal to the connection only (it was discarded and
    // logged); the operation's own outcome still belongs to the caller.
    const auto restored = guard.value().restore();
    if (restored.is_error()) {
        bind_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

template<typename Op>
auto ConnectionSchemaBinder::with_context(const SchemaContext& context, Op&& op)
    -> std::invoke_result_t<Op, IDbConnection&> {
    using R = std::invoke_result_t<Op, IDbConnection&>;

    const auto schema = current_of(context);
    if (!schema) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCode::NO_ACTIVE_SCHEMA, "unit of work has no active schema");
    }
    return with_schema(*schema, std::forward<Op>(op), BindMode::ACTIVE_ONLY);
}

} // namespace pgtenant
