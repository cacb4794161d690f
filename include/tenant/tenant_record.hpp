#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pgtenant {

enum class TenantStatus {
    PROVISIONING,
    ACTIVE,
    SUSPENDED,
    DROPPED
};

[[nodiscard]] constexpr std::string_view tenant_status_name(TenantStatus status) noexcept {
    switch (status) {
        case TenantStatus::PROVISIONING: return "provisioning";
        case TenantStatus::ACTIVE:       return "active";
        case TenantStatus::SUSPENDED:    return "suspended";
        case TenantStatus::DROPPED:      return "dropped";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<TenantStatus> parse_tenant_status(std::string_view name) {
    if (name == "provisioning") return TenantStatus::PROVISIONING;
    if (name == "active") return TenantStatus::ACTIVE;
    if (name == "suspended") return TenantStatus::SUSPENDED;
    if (name == "dropped") return TenantStatus::DROPPED;
    return std::nullopt;
}

struct TenantRecord {
    uint64_t id = 0;                // Surrogate key, assigned by the store
    std::string identifier;         // Business key used for lookup
    std::string schema_name;
    TenantStatus status = TenantStatus::PROVISIONING;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief Keyset position in (identifier, id) order
 *
 * Dropped records keep their identifier, so one identifier can own several
 * records; the id breaks the tie. The default position precedes every record.
 */
struct TenantListPosition {
    std::string identifier;
    uint64_t id = 0;

    [[nodiscard]] static TenantListPosition after(const TenantRecord& record) {
        return {record.identifier, record.id};
    }

    [[nodiscard]] bool precedes(const TenantRecord& record) const {
        return identifier != record.identifier ? identifier < record.identifier : id < record.id;
    }
};

} // namespace pgtenant
