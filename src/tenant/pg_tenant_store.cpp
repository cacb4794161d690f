#include "tenant/pg_tenant_store.hpp"
#include "tenant/schema_name.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <format>

namespace pgtenant {

namespace {

std::chrono::system_clock::time_point from_epoch_ms(const std::string& text) {
    int64_t ms = 0;
    std::from_chars(text.data(), text.data() + text.size(), ms);
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // anonymous namespace

PgTenantStore::PgTenantStore(std::shared_ptr<IConnectionPool> pool, Config config)
    : pool_(std::move(pool)),
      config_(std::move(config)),
      table_ref_(qualified_name(config_.shared_schema, config_.table)),
      id_column_(quote_identifier(config_.identifier_column)) {}

Status PgTenantStore::ensure_schema() {
    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        return Status::error(ErrorCode::POOL_EXHAUSTED, "no connection available for tenant registry");
    }

    const std::string ddl = std::format(
        "CREATE TABLE IF NOT EXISTS {0} ("
        "id BIGSERIAL PRIMARY KEY, "
        "{1} TEXT NOT NULL, "
        "schema_name TEXT NOT NULL, "
        "status TEXT NOT NULL, "
        "created_at TIMESTAMPTZ NOT NULL, "
        "updated_at TIMESTAMPTZ NOT NULL); "
        "CREATE UNIQUE INDEX IF NOT EXISTS {2} ON {0} ({1}) WHERE status <> 'dropped'; "
        "CREATE UNIQUE INDEX IF NOT EXISTS {3} ON {0} (schema_name) WHERE status <> 'dropped'",
        table_ref_, id_column_,
        quote_identifier(config_.table + "_live_identifier"),
        quote_identifier(config_.table + "_live_schema"));

    const auto rs = (*conn)->execute(ddl);
    if (!rs.success) {
        return Status::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to create tenant registry {}: {}", table_ref_, rs.error_message));
    }
    utils::log::info(std::format("Tenant registry table {} ready", table_ref_));
    return Status::ok();
}

std::string PgTenantStore::select_columns() const {
    return std::format(
        "id, {}, schema_name, status, "
        "(extract(epoch FROM created_at) * 1000)::bigint, "
        "(extract(epoch FROM updated_at) * 1000)::bigint",
        id_column_);
}

Result<TenantRecord> PgTenantStore::parse_row(const std::vector<std::string>& row) {
    if (row.size() < 6) {
        return Result<TenantRecord>::error(ErrorCode::DATABASE_ERROR, "malformed tenant registry row");
    }
    const auto status = parse_tenant_status(row[3]);
    if (!status) {
        return Result<TenantRecord>::error(ErrorCode::DATABASE_ERROR,
            std::format("unknown tenant status '{}'", row[3]));
    }

    TenantRecord r;
    std::from_chars(row[0].data(), row[0].data() + row[0].size(), r.id);
    r.identifier = row[1];
    r.schema_name = row[2];
    r.status = *status;
    r.created_at = from_epoch_ms(row[4]);
    r.updated_at = from_epoch_ms(row[5]);
    return Result<TenantRecord>::ok(std::move(r));
}

Result<std::optional<TenantRecord>> PgTenantStore::fetch_one(
    const std::string& sql, const std::vector<std::string>& params) const {
    using R = Result<std::optional<TenantRecord>>;

    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        return R::error(ErrorCode::POOL_EXHAUSTED, "no connection available for tenant registry");
    }
    const auto rs = (*conn)->execute(sql, params);
    if (!rs.success) {
        return R::error(ErrorCode::DATABASE_ERROR, rs.error_message);
    }
    if (rs.rows.empty()) {
        return R::ok(std::nullopt);
    }
    auto parsed = parse_row(rs.rows.front());
    if (parsed.is_error()) {
        return R::from_error(parsed);
    }
    return R::ok(std::move(parsed.value()));
}

Result<TenantRecord> PgTenantStore::insert(TenantRecord record) {
    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        return Result<TenantRecord>::error(ErrorCode::POOL_EXHAUSTED,
            "no connection available for tenant registry");
    }

    const std::string sql = std::format(
        "INSERT INTO {} ({}, schema_name, status, created_at, updated_at) "
        "VALUES ($1, $2, $3, $4, $5) RETURNING id",
        table_ref_, id_column_);
    const auto rs = (*conn)->execute(sql, {
        record.identifier,
        record.schema_name,
        std::string(tenant_status_name(record.status)),
        utils::format_timestamp(record.created_at),
        utils::format_timestamp(record.updated_at),
    });

    if (!rs.success) {
        if (rs.sql_state == sql_state::kUniqueViolation) {
            return Result<TenantRecord>::error(ErrorCode::DUPLICATE_TENANT,
                std::format("tenant '{}' or schema '{}' already registered",
                            record.identifier, record.schema_name));
        }
        return Result<TenantRecord>::error(ErrorCode::DATABASE_ERROR, rs.error_message);
    }
    if (!rs.rows.empty() && !rs.rows.front().empty()) {
        const auto& id = rs.rows.front().front();
        std::from_chars(id.data(), id.data() + id.size(), record.id);
    }
    return Result<TenantRecord>::ok(std::move(record));
}

Result<std::optional<TenantRecord>> PgTenantStore::find_by_identifier(
    const std::string& identifier) const {
    return fetch_one(std::format(
        "SELECT {} FROM {} WHERE {} = $1 "
        "ORDER BY (status = 'dropped'), id DESC LIMIT 1",
        select_columns(), table_ref_, id_column_), {identifier});
}

Result<std::optional<TenantRecord>> PgTenantStore::find_by_schema(
    const std::string& schema_name) const {
    return fetch_one(std::format(
        "SELECT {} FROM {} WHERE schema_name = $1 AND status <> 'dropped' LIMIT 1",
        select_columns(), table_ref_), {schema_name});
}

Result<bool> PgTenantStore::update_status(uint64_t id, TenantStatus expected, TenantStatus next,
                                          std::chrono::system_clock::time_point updated_at) {
    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        return Result<bool>::error(ErrorCode::POOL_EXHAUSTED, "no connection available for tenant registry");
    }

    const std::string sql = std::format(
        "UPDATE {} SET status = $1, updated_at = $2 WHERE id = $3 AND status = $4",
        table_ref_);
    const auto rs = (*conn)->execute(sql, {
        std::string(tenant_status_name(next)),
        utils::format_timestamp(updated_at),
        std::to_string(id),
        std::string(tenant_status_name(expected)),
    });
    if (!rs.success) {
        return Result<bool>::error(ErrorCode::DATABASE_ERROR, rs.error_message);
    }
    return Result<bool>::ok(rs.affected_rows == 1);
}

Result<std::vector<TenantRecord>> PgTenantStore::list(std::optional<TenantStatus> status,
                                                      const TenantListPosition& after,
                                                      size_t limit) const {
    using R = Result<std::vector<TenantRecord>>;

    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        return R::error(ErrorCode::POOL_EXHAUSTED, "no connection available for tenant registry");
    }

    const std::string sql = std::format(
        "SELECT {0} FROM {1} WHERE ($1 = '' OR status = $1) AND ({2}, id) > ($2, $3::bigint) "
        "ORDER BY {2}, id LIMIT {3}",
        select_columns(), table_ref_, id_column_, limit);
    const auto rs = (*conn)->execute(sql, {
        status ? std::string(tenant_status_name(*status)) : std::string{},
        after.identifier,
        std::to_string(after.id),
    });
    if (!rs.success) {
        return R::error(ErrorCode::DATABASE_ERROR, rs.error_message);
    }

    std::vector<TenantRecord> records;
    records.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        auto parsed = parse_row(row);
        if (parsed.is_error()) {
            return R::from_error(parsed);
        }
        records.push_back(std::move(parsed.value()));
    }
    return R::ok(std::move(records));
}

} // namespace pgtenant
