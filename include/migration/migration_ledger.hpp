#pragma once

#include "core/error.hpp"
#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace pgtenant {

class IDbConnection;

struct MigrationLedgerEntry {
    std::string schema_name;
    std::string migration_id;
    std::chrono::system_clock::time_point applied_at;
};

/**
 * @brief Per-schema table of applied migrations
 *
 * Every statement names "<schema>"."<table>" explicitly, so the ledger is
 * read and written correctly whatever search_path the connection carries.
 * The primary key on migration_id makes a concurrent double-apply fail at
 * the ledger insert and roll back with its migration.
 */
class MigrationLedger {
public:
    explicit MigrationLedger(std::string table = "pgtenant_migrations")
        : table_(std::move(table)) {}

    [[nodiscard]] Status ensure_table(IDbConnection& conn, const std::string& schema_name) const;

    /**
     * @brief Whether schema_name already carries a ledger table
     */
    [[nodiscard]] Result<bool> exists(IDbConnection& conn, const std::string& schema_name) const;

    [[nodiscard]] Result<std::set<std::string>> applied_ids(IDbConnection& conn,
                                                            const std::string& schema_name) const;

    [[nodiscard]] Result<std::vector<MigrationLedgerEntry>> entries(
        IDbConnection& conn, const std::string& schema_name) const;

    /**
     * @brief Insert the ledger row; run inside the migration's transaction
     */
    [[nodiscard]] Status record(IDbConnection& conn, const std::string& schema_name,
                                const std::string& migration_id,
                                std::chrono::system_clock::time_point applied_at) const;

    [[nodiscard]] const std::string& table() const { return table_; }

private:
    std::string table_;
};

} // namespace pgtenant
