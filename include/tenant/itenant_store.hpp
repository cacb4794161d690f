#pragma once

#include "core/error.hpp"
#include "tenant/tenant_record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief Persistence for tenant records
 *
 * Every mutating call is a single atomic operation in the backing store:
 * uniqueness among non-dropped records is enforced on insert and status
 * changes are compare-and-set, so callers need no locking of their own.
 */
class ITenantStore {
public:
    virtual ~ITenantStore() = default;

    /**
     * @brief Insert a new record, assigning its id
     * @return DUPLICATE_TENANT if identifier or schema_name is taken by a
     *         non-dropped record
     */
    [[nodiscard]] virtual Result<TenantRecord> insert(TenantRecord record) = 0;

    /**
     * @brief Record for identifier: the non-dropped one if present, otherwise
     *        the most recently dropped one
     */
    [[nodiscard]] virtual Result<std::optional<TenantRecord>> find_by_identifier(
        const std::string& identifier) const = 0;

    /**
     * @brief Non-dropped record owning schema_name
     */
    [[nodiscard]] virtual Result<std::optional<TenantRecord>> find_by_schema(
        const std::string& schema_name) const = 0;

    /**
     * @brief Move record id from expected to next
     * @return false if the record was no longer in the expected status
     */
    [[nodiscard]] virtual Result<bool> update_status(
        uint64_t id, TenantStatus expected, TenantStatus next,
        std::chrono::system_clock::time_point updated_at) = 0;

    /**
     * @brief Page of records ordered by (identifier, id)
     * @param status Only records in this status (all when nullopt)
     * @param after Exclusive lower bound
     */
    [[nodiscard]] virtual Result<std::vector<TenantRecord>> list(
        std::optional<TenantStatus> status,
        const TenantListPosition& after,
        size_t limit) const = 0;
};

} // namespace pgtenant
