#pragma once

#include "core/error.hpp"
#include "migration/migration.hpp"
#include "migration/migration_ledger.hpp"
#include "migration/migration_report.hpp"
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace pgtenant {

class ConnectionSchemaBinder;
class IDbConnection;

/**
 * @brief Applies migration graphs to schemas and tracks them in per-schema ledgers
 *
 * Every migration runs in its own transaction together with its ledger row:
 * a migration that fails leaves neither its effects nor a ledger entry.
 * Schemas are bound in administrative mode, so PROVISIONING and SUSPENDED
 * tenant schemas can be migrated.
 */
class MigrationStateTracker {
public:
    struct BulkOptions {
        size_t max_workers = 4;         // Clamped to the pool's capacity
        std::stop_token stop_token;     // Checked before each schema starts
    };

    MigrationStateTracker(std::shared_ptr<ConnectionSchemaBinder> binder,
                          MigrationLedger ledger);

    [[nodiscard]] Result<std::set<std::string>> applied_migrations(const std::string& schema_name) const;

    [[nodiscard]] Result<std::vector<MigrationLedgerEntry>> ledger_entries(
        const std::string& schema_name) const;

    /**
     * @brief Apply every not-yet-applied migration of graph, in dependency order
     * @return Ids applied by this call (empty when already up to date)
     */
    [[nodiscard]] Result<std::vector<std::string>> apply(const std::string& schema_name,
                                                         const MigrationGraph& graph);

    /**
     * @brief Apply graph to each schema independently
     *
     * A failing schema is reported and never stops the others. Up to
     * effective_workers() schemas run concurrently; a stop request is only
     * honored between schemas, and schemas not yet started are SKIPPED
     * with error_code CANCELLED.
     */
    [[nodiscard]] MigrationReport apply_across_schemas(const std::vector<std::string>& schema_names,
                                                       const MigrationGraph& graph,
                                                       const BulkOptions& options);

    [[nodiscard]] size_t effective_workers(size_t requested, size_t schema_count) const;

    [[nodiscard]] const MigrationLedger& ledger() const { return ledger_; }

private:
    // Appends each committed migration id to applied as it commits
    [[nodiscard]] Status apply_to(const std::string& schema_name,
                                  const MigrationGraph& graph,
                                  std::vector<std::string>& applied);

    [[nodiscard]] Status check_category(const std::string& schema_name,
                                        const MigrationGraph& graph) const;

    [[nodiscard]] Status apply_one(IDbConnection& conn,
                                   const std::string& schema_name,
                                   const Migration& migration) const;

    [[nodiscard]] SchemaMigrationResult migrate_schema(const std::string& schema_name,
                                                       const MigrationGraph& graph);

    std::shared_ptr<ConnectionSchemaBinder> binder_;
    MigrationLedger ledger_;
};

} // namespace pgtenant
