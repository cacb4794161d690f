#include "routing/routing_engine.hpp"
#include "tenant/schema_context.hpp"
#include "tenant/schema_name.hpp"

#include <format>

namespace pgtenant {

RoutingDecisionEngine::RoutingDecisionEngine(EntityClassification classification,
                                             std::string shared_schema)
    : classification_(std::move(classification)),
      shared_schema_(std::move(shared_schema)) {}

Result<EntityScope> RoutingDecisionEngine::classify(const std::string& entity_type) const {
    const auto scope = classification_.scope_of(entity_type);
    if (!scope) {
        return Result<EntityScope>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("entity '{}' is not classified", entity_type));
    }
    return Result<EntityScope>::ok(*scope);
}

Result<std::string> RoutingDecisionEngine::resolve_schema_for(
    const std::string& entity_type,
    const std::optional<std::string>& active_schema) const {

    const auto scope = classify(entity_type);
    if (scope.is_error()) {
        return Result<std::string>::from_error(scope);
    }

    if (scope.value() == EntityScope::SHARED) {
        return Result<std::string>::ok(shared_schema_);
    }
    if (!active_schema || active_schema->empty()) {
        return Result<std::string>::error(ErrorCode::NO_ACTIVE_SCHEMA,
            std::format("tenant entity '{}' accessed with no active schema", entity_type));
    }
    return Result<std::string>::ok(*active_schema);
}

Result<std::string> RoutingDecisionEngine::resolve_schema_for(
    const std::string& entity_type, const SchemaContext& context) const {
    return resolve_schema_for(entity_type, context.current());
}

Result<std::string> RoutingDecisionEngine::qualified_name(
    const std::string& entity_type,
    const std::string& table,
    const std::optional<std::string>& active_schema) const {

    auto schema = resolve_schema_for(entity_type, active_schema);
    if (schema.is_error()) {
        return schema;
    }
    return Result<std::string>::ok(pgtenant::qualified_name(schema.value(), table));
}

} // namespace pgtenant
