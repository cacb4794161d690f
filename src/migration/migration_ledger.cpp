#include "migration/migration_ledger.hpp"
#include "core/utils.hpp"
#include "db/idb_connection.hpp"
#include "db/schema_constants.hpp"
#include "tenant/schema_name.hpp"

#include <charconv>
#include <format>

namespace pgtenant {

Status MigrationLedger::ensure_table(IDbConnection& conn, const std::string& schema_name) const {
    const auto rs = conn.execute(std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "schema_name TEXT NOT NULL, "
        "migration_id TEXT PRIMARY KEY, "
        "applied_at TIMESTAMPTZ NOT NULL)",
        qualified_name(schema_name, table_)));
    if (!rs.success) {
        return Status::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to create migration ledger in '{}': {}", schema_name, rs.error_message));
    }
    return Status::ok();
}

Result<bool> MigrationLedger::exists(IDbConnection& conn, const std::string& schema_name) const {
    const auto rs = conn.execute(std::string(db::kTableExists), {schema_name, table_});
    if (!rs.success) {
        return Result<bool>::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to look up migration ledger of '{}': {}", schema_name, rs.error_message));
    }
    return Result<bool>::ok(!rs.rows.empty());
}

Result<std::set<std::string>> MigrationLedger::applied_ids(IDbConnection& conn,
                                                           const std::string& schema_name) const {
    const auto rs = conn.execute(std::format(
        "SELECT migration_id FROM {}", qualified_name(schema_name, table_)));
    if (!rs.success) {
        return Result<std::set<std::string>>::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to read migration ledger of '{}': {}", schema_name, rs.error_message));
    }
    std::set<std::string> ids;
    for (const auto& row : rs.rows) {
        if (!row.empty()) ids.insert(row[0]);
    }
    return Result<std::set<std::string>>::ok(std::move(ids));
}

Result<std::vector<MigrationLedgerEntry>> MigrationLedger::entries(
    IDbConnection& conn, const std::string& schema_name) const {
    using R = Result<std::vector<MigrationLedgerEntry>>;

    const auto rs = conn.execute(std::format(
        "SELECT schema_name, migration_id, (extract(epoch FROM applied_at) * 1000)::bigint "
        "FROM {} ORDER BY migration_id",
        qualified_name(schema_name, table_)));
    if (!rs.success) {
        return R::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to read migration ledger of '{}': {}", schema_name, rs.error_message));
    }

    std::vector<MigrationLedgerEntry> result;
    result.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row.size() < 3) {
            return R::error(ErrorCode::DATABASE_ERROR, "malformed migration ledger row");
        }
        int64_t ms = 0;
        std::from_chars(row[2].data(), row[2].data() + row[2].size(), ms);
        result.push_back(MigrationLedgerEntry{
            .schema_name = row[0],
            .migration_id = row[1],
            .applied_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(ms)),
        });
    }
    return R::ok(std::move(result));
}

Status MigrationLedger::record(IDbConnection& conn, const std::string& schema_name,
                               const std::string& migration_id,
                               std::chrono::system_clock::time_point applied_at) const {
    const auto rs = conn.execute(std::format(
        "INSERT INTO {} (schema_name, migration_id, applied_at) VALUES ($1, $2, $3)",
        qualified_name(schema_name, table_)),
        {schema_name, migration_id, utils::format_timestamp(applied_at)});
    if (!rs.success) {
        if (rs.sql_state == sql_state::kUniqueViolation) {
            return Status::error(ErrorCode::MIGRATION_CONFLICT,
                std::format("migration '{}' already recorded in '{}'", migration_id, schema_name));
        }
        return Status::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to record migration '{}' in '{}': {}",
                        migration_id, schema_name, rs.error_message));
    }
    return Status::ok();
}

} // namespace pgtenant
