#pragma once

#include "mocks/fake_database.hpp"

#include "db/generic_connection_pool.hpp"
#include "db/schema_binder.hpp"
#include "db/schema_constants.hpp"
#include "migration/migration.hpp"
#include "migration/migration_tracker.hpp"
#include "tenant/memory_tenant_store.hpp"
#include "tenant/schema_lifecycle_manager.hpp"
#include "tenant/tenant_registry.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pgtenant::testing {

/**
 * @brief Builds a chained graph: each migration depends on the one before it
 */
inline MigrationGraph chain(MigrationCategory category,
                            const std::vector<std::pair<std::string, std::string>>& steps) {
    MigrationGraph graph(category);
    std::string previous;
    for (const auto& [id, sql] : steps) {
        Migration m;
        m.id = id;
        m.sql = sql;
        if (!previous.empty()) m.dependencies.push_back(previous);
        const auto added = graph.add(std::move(m));
        (void)added;
        previous = id;
    }
    return graph;
}

inline MigrationGraph widgets_graph() {
    return chain(MigrationCategory::TENANT, {
        {"0001_init", "CREATE TABLE widgets (id TEXT PRIMARY KEY, owner TEXT NOT NULL);"},
    });
}

/**
 * @brief Registry, pool, binder and tracker over one FakeDatabase
 */
struct TenantHarness {
    std::shared_ptr<FakeDatabase> db = std::make_shared<FakeDatabase>();
    std::shared_ptr<FakeConnectionFactory> factory = std::make_shared<FakeConnectionFactory>(db);
    std::shared_ptr<GenericConnectionPool> pool;
    std::shared_ptr<MemoryTenantStore> store = std::make_shared<MemoryTenantStore>();
    std::shared_ptr<TenantRegistry> registry = std::make_shared<TenantRegistry>(store, "public");
    std::shared_ptr<ConnectionSchemaBinder> binder;
    std::shared_ptr<MigrationStateTracker> tracker;

    explicit TenantHarness(size_t max_connections = 4, bool include_public = true) {
        PoolConfig pc;
        pc.connection_string = "fake";
        pc.min_connections = 1;
        pc.max_connections = max_connections;
        pc.session_state_query = std::string(db::kShowSearchPath);
        pool = std::make_shared<GenericConnectionPool>("test-db", pc, factory);

        binder = std::make_shared<ConnectionSchemaBinder>(pool, registry,
            ConnectionSchemaBinder::Config{
                .shared_schema = "public",
                .include_shared_in_search_path = include_public,
                .acquire_timeout = std::chrono::milliseconds(2000),
            });
        tracker = std::make_shared<MigrationStateTracker>(binder, MigrationLedger());
    }

    [[nodiscard]] std::unique_ptr<SchemaLifecycleManager> lifecycle(
        MigrationGraph tenant_graph = widgets_graph(),
        MigrationGraph shared_graph = MigrationGraph(MigrationCategory::SHARED)) const {
        return std::make_unique<SchemaLifecycleManager>(
            registry, binder, tracker, std::move(shared_graph), std::move(tenant_graph));
    }

    // Register and fully provision a tenant; true on success
    bool provision(const std::string& identifier, SchemaLifecycleManager& manager) {
        if (registry->register_tenant(identifier).is_error()) return false;
        return manager.provision(identifier).is_ok();
    }
};

} // namespace pgtenant::testing
