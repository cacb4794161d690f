#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include <memory>

namespace pgtenant {

class ConnectionSchemaBinder;
class IConnectionFactory;
class IConnectionPool;
class ITenantStore;
class MigrationStateTracker;
class RoutingDecisionEngine;
class SchemaLifecycleManager;
class TenantRegistry;

/**
 * @brief Every component of one process, wired from a validated config
 *
 * Construction order matters for teardown: the pool is declared first so
 * it outlives every component holding connections from it.
 */
struct Runtime {
    PgTenantConfig config;
    std::shared_ptr<IConnectionPool> pool;
    std::shared_ptr<ITenantStore> store;
    std::shared_ptr<TenantRegistry> registry;
    std::shared_ptr<RoutingDecisionEngine> routing;
    std::shared_ptr<ConnectionSchemaBinder> binder;
    std::shared_ptr<MigrationStateTracker> tracker;
    std::shared_ptr<SchemaLifecycleManager> lifecycle;

    ~Runtime();

    /**
     * @brief Validate the classification, load migration graphs, open the pool
     *
     * When store is null the registry table in the shared schema is used
     * (and created if missing).
     * @return CONFIGURATION_ERROR for an invalid classification or migration
     *         directory; DATABASE_ERROR / POOL_EXHAUSTED if the database is
     *         unreachable
     */
    [[nodiscard]] static Result<std::unique_ptr<Runtime>> build(
        const PgTenantConfig& config,
        std::shared_ptr<IConnectionFactory> factory,
        std::shared_ptr<ITenantStore> store = nullptr);
};

} // namespace pgtenant
