#pragma once

#include "tenant/itenant_store.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace pgtenant {

class IConnectionPool;
class IDbConnection;

/**
 * @brief Tenant registry table living in the shared schema
 *
 * Uniqueness of identifier and schema_name among live records is enforced
 * by partial unique indexes (WHERE status <> 'dropped'); status changes are
 * conditional UPDATEs. Every statement names the table fully qualified, so
 * the connection's search_path is irrelevant here.
 */
class PgTenantStore : public ITenantStore {
public:
    struct Config {
        std::string shared_schema = "public";
        std::string table = "tenants";
        std::string identifier_column = "identifier";
        std::chrono::milliseconds acquire_timeout{5000};
    };

    PgTenantStore(std::shared_ptr<IConnectionPool> pool, Config config);

    /**
     * @brief Create the registry table and its indexes if missing
     */
    [[nodiscard]] Status ensure_schema();

    Result<TenantRecord> insert(TenantRecord record) override;

    Result<std::optional<TenantRecord>> find_by_identifier(
        const std::string& identifier) const override;

    Result<std::optional<TenantRecord>> find_by_schema(
        const std::string& schema_name) const override;

    Result<bool> update_status(uint64_t id, TenantStatus expected, TenantStatus next,
                               std::chrono::system_clock::time_point updated_at) override;

    Result<std::vector<TenantRecord>> list(std::optional<TenantStatus> status,
                                           const TenantListPosition& after,
                                           size_t limit) const override;

private:
    // Columns in the order parse_row() expects
    [[nodiscard]] std::string select_columns() const;

    [[nodiscard]] static Result<TenantRecord> parse_row(const std::vector<std::string>& row);

    [[nodiscard]] Result<std::optional<TenantRecord>> fetch_one(
        const std::string& sql, const std::vector<std::string>& params) const;

    std::shared_ptr<IConnectionPool> pool_;
    Config config_;
    std::string table_ref_;     // "schema"."table"
    std::string id_column_;     // quoted identifier column
};

} // namespace pgtenant
