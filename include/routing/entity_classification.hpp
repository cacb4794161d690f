#pragma once

#include "core/error.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pgtenant {

enum class EntityScope {
    SHARED,
    TENANT
};

[[nodiscard]] constexpr std::string_view entity_scope_name(EntityScope scope) noexcept {
    return scope == EntityScope::SHARED ? "shared" : "tenant";
}

/**
 * @brief Check that every entity type lands in exactly one of the two sets
 *
 * Entity types are "app.entity"; a set member is either a full entity type or
 * an app label, the latter covering every entity of that app.
 * Fails with CONFIGURATION_ERROR listing every entity that is in both sets
 * or in neither.
 */
[[nodiscard]] Status validate_classification(const std::vector<std::string>& entity_types,
                                             const std::vector<std::string>& shared_set,
                                             const std::vector<std::string>& tenant_set);

/**
 * @brief Immutable entity type → scope table, built once at startup
 */
class EntityClassification {
public:
    /**
     * @brief Validate and build; errors are fatal configuration errors
     */
    [[nodiscard]] static Result<EntityClassification> build(
        const std::vector<std::string>& entity_types,
        const std::vector<std::string>& shared_set,
        const std::vector<std::string>& tenant_set);

    [[nodiscard]] std::optional<EntityScope> scope_of(const std::string& entity_type) const;

    [[nodiscard]] std::vector<std::string> entities_in(EntityScope scope) const;

    [[nodiscard]] size_t size() const { return scopes_.size(); }

private:
    EntityClassification() = default;

    std::unordered_map<std::string, EntityScope> scopes_;
};

} // namespace pgtenant
