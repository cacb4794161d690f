#include "migration/migration_tracker.hpp"
#include "core/utils.hpp"
#include "db/schema_binder.hpp"
#include "db/schema_constants.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <future>

namespace pgtenant {

MigrationStateTracker::MigrationStateTracker(std::shared_ptr<ConnectionSchemaBinder> binder,
                                             MigrationLedger ledger)
    : binder_(std::move(binder)), ledger_(std::move(ledger)) {}

Result<std::set<std::string>> MigrationStateTracker::applied_migrations(
    const std::string& schema_name) const {
    return binder_->with_schema(schema_name, [&](IDbConnection& conn) {
        const auto ready = ledger_.ensure_table(conn, schema_name);
        if (ready.is_error()) {
            return Result<std::set<std::string>>::from_error(ready);
        }
        return ledger_.applied_ids(conn, schema_name);
    }, BindMode::ADMINISTRATIVE);
}

Result<std::vector<MigrationLedgerEntry>> MigrationStateTracker::ledger_entries(
    const std::string& schema_name) const {
    return binder_->with_schema(schema_name, [&](IDbConnection& conn) {
        const auto ready = ledger_.ensure_table(conn, schema_name);
        if (ready.is_error()) {
            return Result<std::vector<MigrationLedgerEntry>>::from_error(ready);
        }
        return ledger_.entries(conn, schema_name);
    }, BindMode::ADMINISTRATIVE);
}

Status MigrationStateTracker::check_category(const std::string& schema_name,
                                             const MigrationGraph& graph) const {
    const bool is_shared = schema_name == binder_->config().shared_schema;
    if (graph.category() == MigrationCategory::TENANT && is_shared) {
        return Status::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("tenant migrations cannot be applied to the shared schema '{}'", schema_name));
    }
    if (graph.category() == MigrationCategory::SHARED && !is_shared) {
        return Status::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("shared migrations cannot be applied to tenant schema '{}'", schema_name));
    }
    return Status::ok();
}

Status MigrationStateTracker::apply_one(IDbConnection& conn,
                                        const std::string& schema_name,
                                        const Migration& migration) const {
    const auto begin = conn.execute(std::string(db::kBegin));
    if (!begin.success) {
        return Status::error(ErrorCode::DATABASE_ERROR,
            std::format("schema '{}': BEGIN failed: {}", schema_name, begin.error_message));
    }

    auto fail = [&](ErrorCode code, const std::string& message) {
        const auto rb = conn.execute(std::string(db::kRollback));
        if (!rb.success) {
            utils::log::error(std::format("schema '{}': ROLLBACK of '{}' failed: {}",
                                          schema_name, migration.id, rb.error_message));
        }
        return Status::error(code, std::format("schema '{}': migration '{}' failed: {}",
                                               schema_name, migration.id, message));
    };

    if (!migration.sql.empty()) {
        const auto rs = conn.execute(migration.sql);
        if (!rs.success) {
            return fail(ErrorCode::DATABASE_ERROR, rs.error_message);
        }
    }
    if (migration.operation) {
        const auto op = migration.operation(conn);
        if (op.is_error()) {
            return fail(op.error_code(), op.error_message());
        }
    }

    const auto recorded = ledger_.record(conn, schema_name, migration.id, utils::now());
    if (recorded.is_error()) {
        return fail(recorded.error_code(), recorded.error_message());
    }

    const auto commit = conn.execute(std::string(db::kCommit));
    if (!commit.success) {
        return fail(ErrorCode::DATABASE_ERROR, commit.error_message);
    }
    return Status::ok();
}

Status MigrationStateTracker::apply_to(const std::string& schema_name,
                                       const MigrationGraph& graph,
                                       std::vector<std::string>& applied) {
    const auto category = check_category(schema_name, graph);
    if (category.is_error()) {
        return category;
    }

    return binder_->with_schema(schema_name, [&](IDbConnection& conn) -> Status {
        const auto ready = ledger_.ensure_table(conn, schema_name);
        if (ready.is_error()) {
            return ready;
        }
        const auto done = ledger_.applied_ids(conn, schema_name);
        if (done.is_error()) {
            return Status::from_error(done);
        }
        const auto pending = graph.plan(done.value());
        if (pending.is_error()) {
            return Status::error(pending.error_code(),
                std::format("schema '{}': {}", schema_name, pending.error_message()));
        }

        for (const auto& id : pending.value()) {
            const auto result = apply_one(conn, schema_name, *graph.find(id));
            if (result.is_error()) {
                return result;
            }
            utils::log::debug(std::format("schema '{}': applied {}", schema_name, id));
            applied.push_back(id);
        }
        return Status::ok();
    }, BindMode::ADMINISTRATIVE);
}

Result<std::vector<std::string>> MigrationStateTracker::apply(const std::string& schema_name,
                                                              const MigrationGraph& graph) {
    std::vector<std::string> applied;
    const auto status = apply_to(schema_name, graph, applied);
    if (status.is_error()) {
        return Result<std::vector<std::string>>::from_error(status);
    }
    if (!applied.empty()) {
        utils::log::info(std::format("schema '{}': applied {} {} migration(s)", schema_name,
                                     applied.size(), migration_category_name(graph.category())));
    }
    return Result<std::vector<std::string>>::ok(std::move(applied));
}

SchemaMigrationResult MigrationStateTracker::migrate_schema(const std::string& schema_name,
                                                            const MigrationGraph& graph) {
    SchemaMigrationResult result;
    result.schema_name = schema_name;
    utils::Timer timer;

    Status status = Status::ok();
    try {
        status = apply_to(schema_name, graph, result.applied);
    } catch (const std::exception& e) {
        status = Status::error(ErrorCode::DATABASE_ERROR,
            std::format("schema '{}': {}", schema_name, e.what()));
    }

    result.duration_ms = static_cast<double>(timer.elapsed().count()) / 1000.0;
    if (status.is_ok()) {
        result.outcome = SchemaOutcome::SUCCEEDED;
        utils::log::info(std::format("migrate '{}': succeeded, {} applied",
                                     schema_name, result.applied.size()));
    } else {
        result.outcome = SchemaOutcome::FAILED;
        result.error_code = status.error_code();
        result.error_message = status.error_message();
        utils::log::error(std::format("migrate '{}': {} {}", schema_name,
                                      error_code_name(status.error_code()), status.error_message()));
    }
    return result;
}

size_t MigrationStateTracker::effective_workers(size_t requested, size_t schema_count) const {
    size_t workers = std::min(requested, binder_->pool()->capacity());
    workers = std::min(workers, schema_count);
    return std::max<size_t>(workers, 1);
}

MigrationReport MigrationStateTracker::apply_across_schemas(
    const std::vector<std::string>& schema_names,
    const MigrationGraph& graph,
    const BulkOptions& options) {

    MigrationReport report;
    report.schemas.resize(schema_names.size());
    for (size_t i = 0; i < schema_names.size(); ++i) {
        report.schemas[i].schema_name = schema_names[i];
    }
    if (schema_names.empty()) {
        return report;
    }

    const size_t num_workers = effective_workers(options.max_workers, schema_names.size());
    utils::log::info(std::format("bulk {} migration over {} schemas with {} worker(s)",
                                 migration_category_name(graph.category()),
                                 schema_names.size(), num_workers));

    // Each worker claims the next schema; results land in input order.
    // Unclaimed slots keep their default SKIPPED outcome.
    std::atomic<size_t> next{0};
    auto worker = [&] {
        while (!options.stop_token.stop_requested()) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= schema_names.size()) return;
            report.schemas[i] = migrate_schema(schema_names[i], graph);
        }
    };

    if (num_workers == 1) {
        worker();
    } else {
        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);
        for (size_t w = 0; w < num_workers; ++w) {
            futures.push_back(std::async(std::launch::async, worker));
        }
        for (auto& f : futures) f.get();
    }

    for (auto& r : report.schemas) {
        if (r.outcome == SchemaOutcome::SKIPPED) {
            r.error_code = ErrorCode::CANCELLED;
            r.error_message = "run cancelled before this schema started";
        }
    }
    const auto skipped = report.count(SchemaOutcome::SKIPPED);
    if (skipped > 0) {
        utils::log::warn(std::format("bulk migration cancelled: {} schema(s) skipped", skipped));
    }
    return report;
}

} // namespace pgtenant
