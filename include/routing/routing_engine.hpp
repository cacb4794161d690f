#pragma once

#include "core/error.hpp"
#include "routing/entity_classification.hpp"
#include <optional>
#include <string>

namespace pgtenant {

class SchemaContext;

/**
 * @brief Decides which physical schema an entity's data lives in
 *
 * SHARED entities always resolve to the shared schema. TENANT entities
 * resolve to the active schema and fail closed with NO_ACTIVE_SCHEMA when
 * there is none; they never fall back to the shared schema.
 */
class RoutingDecisionEngine {
public:
    RoutingDecisionEngine(EntityClassification classification, std::string shared_schema);

    /**
     * @return CONFIGURATION_ERROR for an entity absent from the classification
     */
    [[nodiscard]] Result<EntityScope> classify(const std::string& entity_type) const;

    [[nodiscard]] Result<std::string> resolve_schema_for(
        const std::string& entity_type,
        const std::optional<std::string>& active_schema) const;

    [[nodiscard]] Result<std::string> resolve_schema_for(
        const std::string& entity_type, const SchemaContext& context) const;

    /**
     * @brief Quoted "schema"."table" for an entity's table
     */
    [[nodiscard]] Result<std::string> qualified_name(
        const std::string& entity_type,
        const std::string& table,
        const std::optional<std::string>& active_schema) const;

    [[nodiscard]] const std::string& shared_schema() const { return shared_schema_; }
    [[nodiscard]] const EntityClassification& classification() const { return classification_; }

private:
    EntityClassification classification_;
    std::string shared_schema_;
};

} // namespace pgtenant
