#include "tenant/schema_lifecycle_manager.hpp"
#include "core/utils.hpp"
#include "db/schema_binder.hpp"
#include "db/schema_constants.hpp"
#include "tenant/schema_name.hpp"
#include "tenant/tenant_registry.hpp"

#include <format>
#include <limits>

namespace pgtenant {

// ============================================================================
// TenantCursor
// ============================================================================

TenantCursor::TenantCursor(std::shared_ptr<const TenantRegistry> registry, size_t page_size)
    : registry_(std::move(registry)),
      page_size_(page_size == 0 ? 1 : page_size) {}

Result<std::optional<TenantRecord>> TenantCursor::next() {
    using R = Result<std::optional<TenantRecord>>;

    if (buffer_.empty() && !exhausted_) {
        auto page = registry_->list(TenantStatus::ACTIVE, position_, page_size_);
        if (page.is_error()) {
            return R::from_error(page);
        }
        exhausted_ = page.value().size() < page_size_;
        for (auto& record : page.value()) {
            buffer_.push_back(std::move(record));
        }
    }

    if (buffer_.empty()) {
        return R::ok(std::nullopt);
    }
    TenantRecord record = std::move(buffer_.front());
    buffer_.pop_front();
    position_ = TenantListPosition::after(record);
    return R::ok(std::move(record));
}

void TenantCursor::reset() {
    seek({});
}

void TenantCursor::resume_after(std::string identifier) {
    // Past every record carrying this identifier
    seek({std::move(identifier), std::numeric_limits<uint64_t>::max()});
}

void TenantCursor::seek(TenantListPosition position) {
    position_ = std::move(position);
    buffer_.clear();
    exhausted_ = false;
}

// ============================================================================
// SchemaLifecycleManager
// ============================================================================

SchemaLifecycleManager::SchemaLifecycleManager(std::shared_ptr<TenantRegistry> registry,
                                               std::shared_ptr<ConnectionSchemaBinder> binder,
                                               std::shared_ptr<MigrationStateTracker> tracker,
                                               MigrationGraph shared_graph,
                                               MigrationGraph tenant_graph)
    : registry_(std::move(registry)),
      binder_(std::move(binder)),
      tracker_(std::move(tracker)),
      shared_graph_(std::move(shared_graph)),
      tenant_graph_(std::move(tenant_graph)) {}

Status SchemaLifecycleManager::execute_ddl(const std::string& sql) {
    // DDL names its schema explicitly; the shared binding only supplies a
    // connection with a known search_path.
    return binder_->with_schema(registry_->shared_schema(), [&](IDbConnection& conn) {
        const auto rs = conn.execute(sql);
        if (!rs.success) {
            return Status::error(ErrorCode::DATABASE_ERROR, rs.error_message);
        }
        return Status::ok();
    });
}

Status SchemaLifecycleManager::discard_schema(const std::string& schema_name) {
    const auto dropped = execute_ddl(std::format("DROP SCHEMA IF EXISTS {} CASCADE",
                                                 quote_identifier(schema_name)));
    if (dropped.is_error()) {
        utils::log::error(std::format("failed to drop partially provisioned schema '{}': {}",
                                      schema_name, dropped.error_message()));
    }
    return dropped;
}

std::string SchemaLifecycleManager::cleanup_note(const std::string& schema_name,
                                                 const Status& discarded) {
    if (discarded.is_ok()) {
        return std::format("schema '{}' removed", schema_name);
    }
    return std::format("cleanup failed, schema '{}' left in place for the next attempt: {}",
                       schema_name, discarded.error_message());
}

Result<bool> SchemaLifecycleManager::resumable(const TenantRecord& record) {
    const auto& schema = record.schema_name;
    auto found = binder_->with_schema(registry_->shared_schema(), [&](IDbConnection& conn) {
        const auto rs = conn.execute(std::string(db::kSchemaExists), {schema});
        if (!rs.success) {
            return Result<bool>::error(ErrorCode::DATABASE_ERROR,
                std::format("failed to look up schema '{}': {}", schema, rs.error_message));
        }
        if (rs.rows.empty()) {
            return Result<bool>::ok(false);
        }
        return tracker_->ledger().exists(conn, schema);
    });
    if (found.is_error() || !found.value()) {
        return found;
    }

    // A decommissioned tenant's schema keeps its ledger; never adopt it
    constexpr size_t kPageSize = 100;
    TenantListPosition after;
    while (true) {
        auto page = registry_->list(TenantStatus::DROPPED, after, kPageSize);
        if (page.is_error()) {
            return Result<bool>::from_error(page);
        }
        for (const auto& dropped : page.value()) {
            if (dropped.schema_name == schema) {
                return Result<bool>::ok(false);
            }
        }
        if (page.value().size() < kPageSize) break;
        after = TenantListPosition::after(page.value().back());
    }
    return Result<bool>::ok(true);
}

Result<TenantRecord> SchemaLifecycleManager::provision(const std::string& identifier) {
    auto found = registry_->get(identifier);
    if (found.is_error()) {
        return found;
    }
    const auto record = found.value();
    if (record.status == TenantStatus::DROPPED) {
        return Result<TenantRecord>::error(ErrorCode::TENANT_NOT_FOUND,
            std::format("tenant '{}' has been decommissioned", identifier));
    }
    if (record.status != TenantStatus::PROVISIONING) {
        return Result<TenantRecord>::error(ErrorCode::INVALID_TRANSITION,
            std::format("tenant '{}' is {}, not provisioning",
                        identifier, tenant_status_name(record.status)));
    }
    const auto valid = validate_schema_name(record.schema_name, registry_->shared_schema());
    if (valid.is_error()) {
        return Result<TenantRecord>::from_error(valid);
    }

    const auto& schema = record.schema_name;
    utils::Timer timer;

    // An earlier attempt that could not clean up leaves its schema and
    // ledger behind; the ledger tells apply() where to pick up.
    const auto resume = resumable(record);
    if (resume.is_error()) {
        return Result<TenantRecord>::error(ErrorCode::SCHEMA_PROVISIONING_ERROR,
            std::format("tenant '{}': cannot inspect schema '{}': {}",
                        identifier, schema, resume.error_message()));
    }
    if (resume.value()) {
        utils::log::warn(std::format("Resuming provisioning of '{}' in existing schema '{}'",
                                     identifier, schema));
    } else {
        const auto created = execute_ddl(std::format("CREATE SCHEMA {}", quote_identifier(schema)));
        if (created.is_error()) {
            return Result<TenantRecord>::error(ErrorCode::SCHEMA_PROVISIONING_ERROR,
                std::format("tenant '{}': cannot create schema '{}': {}",
                            identifier, schema, created.error_message()));
        }
    }

    const auto migrated = tracker_->apply(schema, tenant_graph_);
    if (migrated.is_error()) {
        const auto note = cleanup_note(schema, discard_schema(schema));
        utils::log::error(std::format("Provisioning '{}' failed, {}: {}",
                                      identifier, note, migrated.error_message()));
        return Result<TenantRecord>::error(ErrorCode::SCHEMA_PROVISIONING_ERROR,
            std::format("tenant '{}': migrating schema '{}' failed: {} ({}); {}",
                        identifier, schema, migrated.error_message(),
                        error_code_name(migrated.error_code()), note));
    }

    const auto activated = registry_->mark_active(identifier);
    if (activated.is_error()) {
        const auto note = cleanup_note(schema, discard_schema(schema));
        return Result<TenantRecord>::error(ErrorCode::SCHEMA_PROVISIONING_ERROR,
            std::format("tenant '{}': activation failed: {}; {}",
                        identifier, activated.error_message(), note));
    }

    utils::log::info(std::format("Provisioned tenant '{}' in schema '{}' ({} migrations, {}ms)",
                                 identifier, schema, migrated.value().size(),
                                 timer.elapsed_ms().count()));
    return registry_->get(identifier);
}

Status SchemaLifecycleManager::decommission(const std::string& identifier) {
    const auto dropped = registry_->mark_dropped(identifier);
    if (dropped.is_ok()) {
        utils::log::info(std::format("Decommissioned tenant '{}'", identifier));
    }
    return dropped;
}

Status SchemaLifecycleManager::drop_schema(const std::string& identifier,
                                           const std::string& confirmation) {
    auto found = registry_->get(identifier);
    if (found.is_error()) {
        return Status::from_error(found);
    }
    const auto& record = found.value();
    if (record.status != TenantStatus::DROPPED) {
        return Status::error(ErrorCode::INVALID_TRANSITION,
            std::format("tenant '{}' is {}; decommission it before dropping its schema",
                        identifier, tenant_status_name(record.status)));
    }
    if (confirmation != record.schema_name) {
        return Status::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("confirmation '{}' does not match schema '{}'",
                        confirmation, record.schema_name));
    }

    // The name may have been reused by a later registration
    const auto owner = registry_->find_by_schema(record.schema_name);
    if (owner.is_ok()) {
        return Status::error(ErrorCode::INVALID_TRANSITION,
            std::format("schema '{}' now belongs to live tenant '{}'",
                        record.schema_name, owner.value().identifier));
    }
    if (owner.error_code() != ErrorCode::SCHEMA_NOT_FOUND) {
        return Status::from_error(owner);
    }

    const auto dropped = execute_ddl(std::format("DROP SCHEMA IF EXISTS {} CASCADE",
                                                 quote_identifier(record.schema_name)));
    if (dropped.is_error()) {
        return Status::error(dropped.error_code(),
            std::format("dropping schema '{}': {}", record.schema_name, dropped.error_message()));
    }
    utils::log::warn(std::format("Dropped schema '{}' of decommissioned tenant '{}'",
                                 record.schema_name, identifier));
    return Status::ok();
}

Result<std::vector<std::string>> SchemaLifecycleManager::migrate_shared() {
    return tracker_->apply(registry_->shared_schema(), shared_graph_);
}

Result<std::vector<std::string>> SchemaLifecycleManager::migrate_tenant(const std::string& identifier) {
    auto found = registry_->get(identifier);
    if (found.is_error()) {
        return Result<std::vector<std::string>>::from_error(found);
    }
    if (found.value().status == TenantStatus::DROPPED) {
        return Result<std::vector<std::string>>::error(ErrorCode::TENANT_NOT_FOUND,
            std::format("tenant '{}' has been decommissioned", identifier));
    }
    return tracker_->apply(found.value().schema_name, tenant_graph_);
}

Result<MigrationReport> SchemaLifecycleManager::migrate_all_tenants(
    const MigrationStateTracker::BulkOptions& options) {
    std::vector<std::string> schemas;
    auto cursor = list_provisioned();
    while (true) {
        auto next = cursor.next();
        if (next.is_error()) {
            return Result<MigrationReport>::from_error(next);
        }
        if (!next.value()) break;
        schemas.push_back(next.value()->schema_name);
    }
    return Result<MigrationReport>::ok(tracker_->apply_across_schemas(schemas, tenant_graph_, options));
}

TenantCursor SchemaLifecycleManager::list_provisioned(size_t page_size) const {
    return TenantCursor(registry_, page_size);
}

} // namespace pgtenant
