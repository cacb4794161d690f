#pragma once

#include "tenant/itenant_store.hpp"
#include <cstdint>
#include <shared_mutex>
#include <vector>

namespace pgtenant {

/**
 * @brief Process-local tenant store
 *
 * Used by tests and by dry runs. A single shared_mutex gives each call the
 * same atomicity the PostgreSQL store gets from single statements.
 */
class MemoryTenantStore : public ITenantStore {
public:
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

    [[nodiscard]] size_t size() const;

private:
    std::vector<TenantRecord> records_;     // Append-only, dropped records retained
    uint64_t next_id_ = 1;
    mutable std::shared_mutex mutex_;
};

} // namespace pgtenant
