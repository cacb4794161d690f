#include "routing/entity_classification.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace pgtenant {

namespace {

std::string app_label_of(const std::string& entity_type) {
    const auto dot = entity_type.find('.');
    return dot == std::string::npos ? std::string{} : entity_type.substr(0, dot);
}

bool covers(const std::unordered_set<std::string>& set, const std::string& entity_type) {
    if (set.contains(entity_type)) return true;
    const auto app = app_label_of(entity_type);
    return !app.empty() && set.contains(app);
}

} // anonymous namespace

Status validate_classification(const std::vector<std::string>& entity_types,
                               const std::vector<std::string>& shared_set,
                               const std::vector<std::string>& tenant_set) {
    const std::unordered_set<std::string> shared(shared_set.begin(), shared_set.end());
    const std::unordered_set<std::string> tenant(tenant_set.begin(), tenant_set.end());

    std::vector<std::string> errors;
    for (const auto& entity : entity_types) {
        if (app_label_of(entity).empty()) {
            errors.push_back(std::format("entity '{}' is not of the form app.entity", entity));
            continue;
        }
        const bool in_shared = covers(shared, entity);
        const bool in_tenant = covers(tenant, entity);
        if (in_shared && in_tenant) {
            errors.push_back(std::format("entity '{}' is classified both shared and tenant", entity));
        } else if (!in_shared && !in_tenant) {
            errors.push_back(std::format("entity '{}' is classified neither shared nor tenant", entity));
        }
    }

    if (errors.empty()) {
        return Status::ok();
    }
    return Status::error(ErrorCode::CONFIGURATION_ERROR,
        "Entity classification invalid:\n  - " + utils::join(errors, "\n  - "));
}

Result<EntityClassification> EntityClassification::build(
    const std::vector<std::string>& entity_types,
    const std::vector<std::string>& shared_set,
    const std::vector<std::string>& tenant_set) {

    const auto valid = validate_classification(entity_types, shared_set, tenant_set);
    if (valid.is_error()) {
        return Result<EntityClassification>::from_error(valid);
    }

    const std::unordered_set<std::string> shared(shared_set.begin(), shared_set.end());

    EntityClassification classification;
    for (const auto& entity : entity_types) {
        classification.scopes_[entity] =
            covers(shared, entity) ? EntityScope::SHARED : EntityScope::TENANT;
    }
    return Result<EntityClassification>::ok(std::move(classification));
}

std::optional<EntityScope> EntityClassification::scope_of(const std::string& entity_type) const {
    const auto it = scopes_.find(entity_type);
    if (it == scopes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> EntityClassification::entities_in(EntityScope scope) const {
    std::vector<std::string> result;
    for (const auto& [entity, s] : scopes_) {
        if (s == scope) result.push_back(entity);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace pgtenant
