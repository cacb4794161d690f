#pragma once

#include "core/error.hpp"
#include "migration/migration.hpp"
#include "migration/migration_tracker.hpp"
#include "tenant/tenant_record.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pgtenant {

class ConnectionSchemaBinder;
class TenantRegistry;

/**
 * @brief Lazy, restartable iteration over ACTIVE tenants ordered by identifier
 *
 * Pages are fetched from the registry on demand, keyed by the last
 * (identifier, id) returned, so tenants registered or activated mid-iteration
 * after the current position are still seen.
 */
class TenantCursor {
public:
    TenantCursor(std::shared_ptr<const TenantRegistry> registry, size_t page_size);

    /**
     * @return The next record, std::nullopt at the end
     */
    [[nodiscard]] Result<std::optional<TenantRecord>> next();

    /**
     * @brief Start over from the first identifier
     */
    void reset();

    /**
     * @brief Continue with identifiers strictly after identifier
     */
    void resume_after(std::string identifier);

    [[nodiscard]] const std::string& position() const { return position_.identifier; }

private:
    void seek(TenantListPosition position);

    std::shared_ptr<const TenantRegistry> registry_;
    size_t page_size_;
    TenantListPosition position_;       // Last record handed out
    std::deque<TenantRecord> buffer_;
    bool exhausted_ = false;
};

/**
 * @brief Provisions, migrates and decommissions tenant schemas
 *
 * Administrative flows only; never on the request path.
 */
class SchemaLifecycleManager {
public:
    SchemaLifecycleManager(std::shared_ptr<TenantRegistry> registry,
                           std::shared_ptr<ConnectionSchemaBinder> binder,
                           std::shared_ptr<MigrationStateTracker> tracker,
                           MigrationGraph shared_graph,
                           MigrationGraph tenant_graph);

    /**
     * @brief Create the tenant's schema, apply the tenant graph, mark ACTIVE
     *
     * All or nothing: if anything fails after CREATE SCHEMA the schema is
     * dropped again and the record stays PROVISIONING for a retry. When that
     * drop fails too the error says so, and the retry continues in the
     * schema left behind, which is recognised by its migration ledger.
     * @return TENANT_NOT_FOUND without a live record, INVALID_TRANSITION if
     *         the tenant is not PROVISIONING, SCHEMA_PROVISIONING_ERROR with
     *         the cause otherwise
     */
    [[nodiscard]] Result<TenantRecord> provision(const std::string& identifier);

    /**
     * @brief Mark the tenant DROPPED; the schema is left in place
     */
    [[nodiscard]] Status decommission(const std::string& identifier);

    /**
     * @brief Physically drop a decommissioned tenant's schema
     *
     * Only for DROPPED records, and only when confirmation repeats the
     * schema name.
     */
    [[nodiscard]] Status drop_schema(const std::string& identifier, const std::string& confirmation);

    [[nodiscard]] Result<std::vector<std::string>> migrate_shared();

    /**
     * @brief Apply the tenant graph to one live tenant's schema
     */
    [[nodiscard]] Result<std::vector<std::string>> migrate_tenant(const std::string& identifier);

    /**
     * @brief Apply the tenant graph to every ACTIVE tenant
     */
    [[nodiscard]] Result<MigrationReport> migrate_all_tenants(
        const MigrationStateTracker::BulkOptions& options);

    [[nodiscard]] TenantCursor list_provisioned(size_t page_size = 100) const;

    [[nodiscard]] const MigrationGraph& shared_graph() const { return shared_graph_; }
    [[nodiscard]] const MigrationGraph& tenant_graph() const { return tenant_graph_; }

private:
    [[nodiscard]] Status execute_ddl(const std::string& sql);

    // Cleanup after a failed provision
    [[nodiscard]] Status discard_schema(const std::string& schema_name);

    [[nodiscard]] static std::string cleanup_note(const std::string& schema_name,
                                                  const Status& discarded);

    // True when schema exists with a ledger and no dropped tenant ever owned it
    [[nodiscard]] Result<bool> resumable(const TenantRecord& record);

    std::shared_ptr<TenantRegistry> registry_;
    std::shared_ptr<ConnectionSchemaBinder> binder_;
    std::shared_ptr<MigrationStateTracker> tracker_;
    MigrationGraph shared_graph_;
    MigrationGraph tenant_graph_;
};

} // namespace pgtenant
