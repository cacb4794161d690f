#include "db/schema_binder.hpp"
#include "db/schema_constants.hpp"
#include "tenant/schema_context.hpp"
#include "tenant/schema_name.hpp"
#include "tenant/tenant_registry.hpp"

#include <atomic>
#include <exception>

namespace pgtenant {

// ============================================================================
// SearchPathGuard
// ============================================================================

namespace {

std::atomic<uint64_t> g_savepoint_seq{0};

std::string make_savepoint_name() {
    return std::format("pgtenant_bind_{}", g_savepoint_seq.fetch_add(1, std::memory_order_relaxed));
}

} // namespace

Result<SearchPathGuard> SearchPathGuard::bind(PooledConnection& conn,
                                              const std::string& search_path) {
    auto current = conn->execute(std::string(db::kShowSearchPath));
    if (!current.success || current.rows.empty() || current.rows[0].empty()) {
        conn.discard();
        return Result<SearchPathGuard>::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to read search_path: {}", current.error_message));
    }
    std::string previous = current.rows[0][0];

    // Inside the caller's transaction: scope the binding to a savepoint so
    // unwinding it never rolls back the caller's own work.
    std::string savepoint;
    if (conn->in_transaction()) {
        savepoint = make_savepoint_name();
        const auto sp = conn->execute(std::string(db::kSavepoint) + savepoint);
        if (!sp.success) {
            return Result<SearchPathGuard>::error(ErrorCode::DATABASE_ERROR,
                std::format("failed to open savepoint for search_path '{}': {}",
                            search_path, sp.error_message));
        }
    }

    const auto set = conn->execute(std::string(db::kSetSearchPath), {search_path});
    if (!set.success) {
        if (!savepoint.empty()) {
            const bool unwound =
                conn->execute(std::string(db::kRollbackToSavepoint) + savepoint).success &&
                conn->execute(std::string(db::kReleaseSavepoint) + savepoint).success;
            if (!unwound) conn.discard();
        }
        return Result<SearchPathGuard>::error(ErrorCode::DATABASE_ERROR,
            std::format("failed to set search_path to '{}': {}", search_path, set.error_message));
    }

    utils::log::debug(std::format("search_path bound: '{}' (was '{}'){}", search_path, previous,
                                  savepoint.empty() ? std::string{} : " under savepoint " + savepoint));
    return Result<SearchPathGuard>::ok(
        SearchPathGuard(conn, std::move(previous), std::move(savepoint)));
}

SearchPathGuard::SearchPathGuard(PooledConnection& conn, std::string previous, std::string savepoint)
    : conn_(&conn), previous_(std::move(previous)), savepoint_(std::move(savepoint)) {}

SearchPathGuard::SearchPathGuard(SearchPathGuard&& other) noexcept
    : conn_(other.conn_),
      previous_(std::move(other.previous_)),
      savepoint_(std::move(other.savepoint_)) {
    other.conn_ = nullptr;
}

SearchPathGuard::~SearchPathGuard() {
    if (!conn_) return;
    try {
        const auto restored = restore();
        (void)restored;     // restore() already logged and discarded on failure
    } catch (const std::exception& e) {
        conn_->discard();
        utils::log::critical(std::format(
            "ConnectionLeakDetected: exception while restoring search_path '{}': {}",
            previous_, e.what()));
    }
}

Status SearchPathGuard::restore() {
    if (!conn_) {
        return Status::ok();
    }
    PooledConnection& conn = *conn_;
    conn_ = nullptr;

    if (!conn.is_valid()) {
        conn.discard();
        utils::log::critical(std::format(
            "ConnectionLeakDetected: connection lost before search_path '{}' was restored",
            previous_));
        return Status::error(ErrorCode::CONNECTION_LEAK_DETECTED,
            "connection lost before search_path restore");
    }

    // The caller's transaction is still open: it is not ours to end
    if (!savepoint_.empty() && conn->in_transaction()) {
        return restore_to_savepoint(conn);
    }

    // An operation that errored or was interrupted may leave its transaction
    // open; set_config would be rolled into it (or rejected if it failed).
    if (conn->in_transaction()) {
        const auto rb = conn->execute(std::string(db::kRollback));
        if (!rb.success) {
            conn.discard();
            utils::log::critical(std::format(
                "ConnectionLeakDetected: rollback before restore failed: {}", rb.error_message));
            return Status::error(ErrorCode::CONNECTION_LEAK_DETECTED,
                std::format("rollback before restore failed: {}", rb.error_message));
        }
        utils::log::warn("rolled back transaction left open inside a schema binding");
    }

    const auto set = conn->execute(std::string(db::kSetSearchPath), {previous_});
    if (!set.success) {
        conn.discard();
        utils::log::critical(std::format(
            "ConnectionLeakDetected: failed to restore search_path '{}': {}",
            previous_, set.error_message));
        return Status::error(ErrorCode::CONNECTION_LEAK_DETECTED,
            std::format("failed to restore search_path '{}': {}", previous_, set.error_message));
    }
    return Status::ok();
}

Status SearchPathGuard::restore_to_savepoint(PooledConnection& conn) {
    auto leak = [&](const std::string& what, const std::string& detail) {
        conn.discard();
        utils::log::critical(std::format("ConnectionLeakDetected: {} for savepoint {}: {}",
                                         what, savepoint_, detail));
        return Status::error(ErrorCode::CONNECTION_LEAK_DETECTED,
            std::format("{} for savepoint {}: {}", what, savepoint_, detail));
    };

    auto set = conn->execute(std::string(db::kSetSearchPath), {previous_});
    if (!set.success) {
        // A statement failed under the binding and aborted the block.
        // Unwinding to the savepoint reverts it and the search_path change.
        const auto rb = conn->execute(std::string(db::kRollbackToSavepoint) + savepoint_);
        if (!rb.success) {
            return leak("rollback to savepoint failed", rb.error_message);
        }
        utils::log::warn(std::format(
            "rolled back to savepoint {} after a failed statement inside a schema binding",
            savepoint_));
        set = conn->execute(std::string(db::kSetSearchPath), {previous_});
        if (!set.success) {
            return leak(std::format("failed to restore search_path '{}'", previous_),
                        set.error_message);
        }
    }

    const auto released = conn->execute(std::string(db::kReleaseSavepoint) + savepoint_);
    if (!released.success) {
        return leak("release failed", released.error_message);
    }
    return Status::ok();
}

// ============================================================================
// ConnectionSchemaBinder
// ============================================================================

ConnectionSchemaBinder::ConnectionSchemaBinder(std::shared_ptr<IConnectionPool> pool,
                                               std::shared_ptr<const TenantRegistry> registry,
                                               Config config)
    : pool_(std::move(pool)),
      registry_(std::move(registry)),
      config_(std::move(config)) {}

Status ConnectionSchemaBinder::check_bindable(const std::string& schema_name,
                                              BindMode mode) const {
    if (schema_name == config_.shared_schema) {
        return Status::ok();
    }

    const auto record = registry_->find_by_schema(schema_name);
    if (record.is_error()) {
        if (record.error_code() == ErrorCode::SCHEMA_NOT_FOUND) {
            return Status::error(ErrorCode::SCHEMA_NOT_FOUND,
                std::format("schema '{}' is not a provisioned tenant schema", schema_name));
        }
        return Status::from_error(record);
    }

    const auto status = record.value().status;
    const bool allowed = status == TenantStatus::ACTIVE ||
        (mode == BindMode::ADMINISTRATIVE &&
         (status == TenantStatus::PROVISIONING || status == TenantStatus::SUSPENDED));
    if (!allowed) {
        return Status::error(ErrorCode::SCHEMA_NOT_FOUND,
            std::format("schema '{}' belongs to tenant '{}' in status {}",
                        schema_name, record.value().identifier,
                        tenant_status_name(status)));
    }
    return Status::ok();
}

std::string ConnectionSchemaBinder::search_path_for(const std::string& schema_name) const {
    if (schema_name == config_.shared_schema || !config_.include_shared_in_search_path) {
        return quote_identifier(schema_name);
    }
    return quote_identifier(schema_name) + ", " + quote_identifier(config_.shared_schema);
}

Result<SearchPathGuard> ConnectionSchemaBinder::bind_nested(PooledConnection& conn,
                                                            const std::string& schema_name,
                                                            BindMode mode) const {
    const auto allowed = check_bindable(schema_name, mode);
    if (allowed.is_error()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return Result<SearchPathGuard>::from_error(allowed);
    }
    auto guard = SearchPathGuard::bind(conn, search_path_for(schema_name));
    if (guard.is_error()) {
        bind_failures_.fetch_add(1, std::memory_order_relaxed);
    } else {
        binds_.fetch_add(1, std::memory_order_relaxed);
    }
    return guard;
}

ConnectionSchemaBinder::Stats ConnectionSchemaBinder::get_stats() const {
    return Stats{
        .binds = binds_.load(std::memory_order_relaxed),
        .bind_failures = bind_failures_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
    };
}

std::optional<std::string> ConnectionSchemaBinder::current_of(const SchemaContext& context) const {
    return context.current();
}

} // namespace pgtenant
