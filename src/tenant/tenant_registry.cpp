#include "tenant/tenant_registry.hpp"
#include "tenant/schema_name.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgtenant {

TenantRegistry::TenantRegistry(std::shared_ptr<ITenantStore> store, std::string shared_schema)
    : store_(std::move(store)), shared_schema_(std::move(shared_schema)) {}

Result<TenantRecord> TenantRegistry::register_tenant(const std::string& identifier,
                                                     const std::string& schema_name) {
    if (identifier.empty()) {
        return Result<TenantRecord>::error(ErrorCode::INVALID_IDENTIFIER,
            "tenant identifier must not be empty");
    }
    const auto valid = validate_schema_name(schema_name, shared_schema_);
    if (valid.is_error()) {
        return Result<TenantRecord>::from_error(valid);
    }

    TenantRecord record;
    record.identifier = identifier;
    record.schema_name = schema_name;
    record.status = TenantStatus::PROVISIONING;
    record.created_at = utils::now();
    record.updated_at = record.created_at;

    auto inserted = store_->insert(std::move(record));
    if (inserted.is_ok()) {
        utils::log::info(std::format("Registered tenant '{}' → schema '{}'",
                                     identifier, schema_name));
    }
    return inserted;
}

Result<TenantRecord> TenantRegistry::register_tenant(const std::string& identifier) {
    return register_tenant(identifier, derive_schema_name(identifier));
}

Result<std::string> TenantRegistry::lookup(const std::string& identifier) const {
    auto found = store_->find_by_identifier(identifier);
    if (found.is_error()) {
        return Result<std::string>::from_error(found);
    }
    const auto& record = found.value();
    if (!record || record->status != TenantStatus::ACTIVE) {
        return Result<std::string>::error(ErrorCode::TENANT_NOT_FOUND,
            std::format("no active tenant '{}'", identifier));
    }
    return Result<std::string>::ok(record->schema_name);
}

Result<TenantRecord> TenantRegistry::get(const std::string& identifier) const {
    auto found = store_->find_by_identifier(identifier);
    if (found.is_error()) {
        return Result<TenantRecord>::from_error(found);
    }
    if (!found.value()) {
        return Result<TenantRecord>::error(ErrorCode::TENANT_NOT_FOUND,
            std::format("tenant '{}' is not registered", identifier));
    }
    return Result<TenantRecord>::ok(std::move(*found.value()));
}

Result<TenantRecord> TenantRegistry::find_by_schema(const std::string& schema_name) const {
    auto found = store_->find_by_schema(schema_name);
    if (found.is_error()) {
        return Result<TenantRecord>::from_error(found);
    }
    if (!found.value()) {
        return Result<TenantRecord>::error(ErrorCode::SCHEMA_NOT_FOUND,
            std::format("no tenant owns schema '{}'", schema_name));
    }
    return Result<TenantRecord>::ok(std::move(*found.value()));
}

Status TenantRegistry::mark_active(const std::string& identifier) {
    return transition(identifier, TenantStatus::ACTIVE);
}

Status TenantRegistry::mark_suspended(const std::string& identifier) {
    return transition(identifier, TenantStatus::SUSPENDED);
}

Status TenantRegistry::mark_dropped(const std::string& identifier) {
    return transition(identifier, TenantStatus::DROPPED);
}

Result<std::vector<TenantRecord>> TenantRegistry::list(std::optional<TenantStatus> status,
                                                       const TenantListPosition& after,
                                                       size_t limit) const {
    return store_->list(status, after, limit);
}

bool TenantRegistry::is_allowed(TenantStatus from, TenantStatus to) noexcept {
    switch (to) {
        case TenantStatus::ACTIVE:
            return from == TenantStatus::PROVISIONING || from == TenantStatus::SUSPENDED;
        case TenantStatus::SUSPENDED:
            return from == TenantStatus::ACTIVE;
        case TenantStatus::DROPPED:
            return from != TenantStatus::DROPPED;
        case TenantStatus::PROVISIONING:
            return false;
    }
    return false;
}

Status TenantRegistry::transition(const std::string& identifier, TenantStatus next) {
    auto current = get(identifier);
    if (current.is_error()) {
        return Status::from_error(current);
    }
    const auto& record = current.value();

    if (record.status == TenantStatus::DROPPED) {
        return Status::error(ErrorCode::INVALID_TRANSITION,
            std::format("tenant '{}' is dropped; no further transitions", identifier));
    }
    if (record.status == next) {
        return Status::ok();
    }
    if (!is_allowed(record.status, next)) {
        return Status::error(ErrorCode::INVALID_TRANSITION,
            std::format("tenant '{}': {} → {} not allowed", identifier,
                        tenant_status_name(record.status), tenant_status_name(next)));
    }

    auto updated = store_->update_status(record.id, record.status, next, utils::now());
    if (updated.is_error()) {
        return Status::from_error(updated);
    }
    if (!updated.value()) {
        return Status::error(ErrorCode::INVALID_TRANSITION,
            std::format("tenant '{}' changed status concurrently", identifier));
    }

    utils::log::info(std::format("Tenant '{}': {} → {}", identifier,
                                 tenant_status_name(record.status), tenant_status_name(next)));
    return Status::ok();
}

} // namespace pgtenant
