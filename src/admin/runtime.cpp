#include "admin/runtime.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/schema_binder.hpp"
#include "db/schema_constants.hpp"
#include "migration/migration_loader.hpp"
#include "migration/migration_tracker.hpp"
#include "routing/entity_classification.hpp"
#include "routing/routing_engine.hpp"
#include "tenant/pg_tenant_store.hpp"
#include "tenant/schema_lifecycle_manager.hpp"
#include "tenant/tenant_registry.hpp"

#include <format>

namespace pgtenant {

namespace {

PoolConfig make_pool_config(const DatabaseConfig& db) {
    PoolConfig pc;
    pc.connection_string = db.connection_string;
    pc.min_connections = db.min_connections;
    pc.max_connections = db.max_connections;
    pc.connection_timeout = db.connection_timeout;
    pc.idle_timeout = std::chrono::seconds(db.idle_timeout_seconds);
    pc.max_lifetime = std::chrono::seconds(db.max_lifetime_seconds);
    pc.health_check_query = db.health_check_query;
    if (db.verify_session_on_release) {
        pc.session_state_query = std::string(db::kShowSearchPath);
    }
    return pc;
}

} // anonymous namespace

Runtime::~Runtime() {
    // Components first; then close whatever the pool still holds
    lifecycle.reset();
    tracker.reset();
    binder.reset();
    routing.reset();
    registry.reset();
    store.reset();
    if (pool) pool->drain();
}

Result<std::unique_ptr<Runtime>> Runtime::build(const PgTenantConfig& config,
                                                std::shared_ptr<IConnectionFactory> factory,
                                                std::shared_ptr<ITenantStore> store) {
    using R = Result<std::unique_ptr<Runtime>>;

    const auto& tenancy = config.tenancy;
    const auto& shared_schema = tenancy.public_schema_name;

    // [1] Entity classification: fatal before anything touches the database
    auto classification = EntityClassification::build(
        config.apps.entities, config.apps.shared, config.apps.tenant);
    if (classification.is_error()) {
        return R::from_error(classification);
    }
    const auto model_scope = classification.value().scope_of(tenancy.tenant_model);
    if (!model_scope) {
        return R::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("tenant model '{}' is not a declared entity", tenancy.tenant_model));
    }
    if (*model_scope != EntityScope::SHARED) {
        return R::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("tenant model '{}' must be classified shared", tenancy.tenant_model));
    }

    // [2] Migration graphs; full order checked so cycles fail at startup
    auto shared_graph = MigrationLoader::load_directory(config.migrations.shared_dir,
                                                        MigrationCategory::SHARED);
    if (shared_graph.is_error()) {
        return R::from_error(shared_graph);
    }
    auto tenant_graph = MigrationLoader::load_directory(config.migrations.tenant_dir,
                                                        MigrationCategory::TENANT);
    if (tenant_graph.is_error()) {
        return R::from_error(tenant_graph);
    }
    for (const auto* graph : {&shared_graph.value(), &tenant_graph.value()}) {
        const auto order = graph->ordered_ids();
        if (order.is_error()) {
            return R::from_error(order);
        }
    }

    auto rt = std::make_unique<Runtime>();
    rt->config = config;

    // [3] Pool
    rt->pool = std::make_shared<GenericConnectionPool>(
        "pgtenant", make_pool_config(config.database), std::move(factory));

    // [4] Registry
    if (!store) {
        auto pg_store = std::make_shared<PgTenantStore>(rt->pool, PgTenantStore::Config{
            .shared_schema = shared_schema,
            .table = tenancy.registry_table(),
            .identifier_column = tenancy.tenant_identifier_field,
            .acquire_timeout = config.database.connection_timeout,
        });
        const auto ready = pg_store->ensure_schema();
        if (ready.is_error()) {
            return R::from_error(ready);
        }
        store = std::move(pg_store);
    }
    rt->store = store;
    rt->registry = std::make_shared<TenantRegistry>(std::move(store), shared_schema);

    // [5] Routing, binding, migrations, lifecycle
    rt->routing = std::make_shared<RoutingDecisionEngine>(std::move(classification.value()),
                                                          shared_schema);
    rt->binder = std::make_shared<ConnectionSchemaBinder>(rt->pool, rt->registry,
        ConnectionSchemaBinder::Config{
            .shared_schema = shared_schema,
            .include_shared_in_search_path = tenancy.include_public_in_search_path,
            .acquire_timeout = config.database.connection_timeout,
        });
    rt->tracker = std::make_shared<MigrationStateTracker>(
        rt->binder, MigrationLedger(config.migrations.ledger_table));
    rt->lifecycle = std::make_shared<SchemaLifecycleManager>(
        rt->registry, rt->binder, rt->tracker,
        std::move(shared_graph.value()), std::move(tenant_graph.value()));

    utils::log::info(std::format("Runtime ready: shared schema '{}', {} shared / {} tenant migrations",
        shared_schema, rt->lifecycle->shared_graph().size(), rt->lifecycle->tenant_graph().size()));
    return R::ok(std::move(rt));
}

} // namespace pgtenant
