#pragma once

#include "core/error.hpp"
#include "tenant/itenant_store.hpp"
#include "tenant/tenant_record.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief Authoritative identifier → schema mapping
 *
 * Stateless over its store: every call reads or writes the store directly,
 * so concurrent registries over the same store stay consistent.
 *
 * Status transitions:
 *   PROVISIONING → ACTIVE, SUSPENDED → ACTIVE, ACTIVE → SUSPENDED,
 *   any live status → DROPPED. DROPPED is terminal.
 */
class TenantRegistry {
public:
    TenantRegistry(std::shared_ptr<ITenantStore> store, std::string shared_schema);

    /**
     * @brief Register a tenant with an explicit schema name (status PROVISIONING)
     */
    [[nodiscard]] Result<TenantRecord> register_tenant(const std::string& identifier,
                                                       const std::string& schema_name);

    /**
     * @brief Register a tenant, deriving the schema name from the identifier
     */
    [[nodiscard]] Result<TenantRecord> register_tenant(const std::string& identifier);

    /**
     * @brief Schema of the ACTIVE tenant with this identifier
     * @return TENANT_NOT_FOUND unless an ACTIVE record matches
     */
    [[nodiscard]] Result<std::string> lookup(const std::string& identifier) const;

    /**
     * @brief Record for identifier in any status (live record preferred)
     */
    [[nodiscard]] Result<TenantRecord> get(const std::string& identifier) const;

    /**
     * @brief Live record owning schema_name
     */
    [[nodiscard]] Result<TenantRecord> find_by_schema(const std::string& schema_name) const;

    [[nodiscard]] Status mark_active(const std::string& identifier);
    [[nodiscard]] Status mark_suspended(const std::string& identifier);
    [[nodiscard]] Status mark_dropped(const std::string& identifier);

    /**
     * @brief Page of records after a keyset position
     *
     * Continue with TenantListPosition::after(last record of the page).
     */
    [[nodiscard]] Result<std::vector<TenantRecord>> list(std::optional<TenantStatus> status,
                                                         const TenantListPosition& after = {},
                                                         size_t limit = 100) const;

    [[nodiscard]] const std::string& shared_schema() const { return shared_schema_; }

private:
    [[nodiscard]] Status transition(const std::string& identifier, TenantStatus next);

    [[nodiscard]] static bool is_allowed(TenantStatus from, TenantStatus to) noexcept;

    std::shared_ptr<ITenantStore> store_;
    std::string shared_schema_;
};

} // namespace pgtenant
