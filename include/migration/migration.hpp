#pragma once

#include "core/error.hpp"
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pgtenant {

class IDbConnection;

/**
 * @brief Which schemas a migration graph applies to
 *
 * The shared graph only ever runs against the shared schema and the tenant
 * graph only against tenant schemas.
 */
enum class MigrationCategory {
    SHARED,
    TENANT
};

[[nodiscard]] constexpr std::string_view migration_category_name(MigrationCategory c) noexcept {
    switch (c) {
        case MigrationCategory::SHARED: return "shared";
        case MigrationCategory::TENANT: return "tenant";
    }
    return "unknown";
}

/**
 * @brief One versioned schema change
 *
 * sql runs as a single simple-query batch with the target schema bound as
 * search_path; operation, if set, runs afterwards in the same transaction.
 */
struct Migration {
    std::string id;                             // "0001_init"
    std::vector<std::string> dependencies;
    std::string sql;
    std::function<Status(IDbConnection&)> operation;
};

/**
 * @brief Dependency graph of the migrations of one category
 */
class MigrationGraph {
public:
    explicit MigrationGraph(MigrationCategory category) : category_(category) {}

    /**
     * @return MIGRATION_CONFLICT if a migration with the same id exists
     */
    [[nodiscard]] Status add(Migration migration);

    [[nodiscard]] bool contains(const std::string& id) const { return migrations_.contains(id); }
    [[nodiscard]] const Migration* find(const std::string& id) const;

    [[nodiscard]] std::vector<std::string> ids() const;

    /**
     * @brief Migrations no other migration depends on
     */
    [[nodiscard]] std::vector<std::string> leaf_nodes() const;

    /**
     * @brief Full dependency order; ties broken by id
     * @return MIGRATION_CONFLICT on a cycle or a dependency outside the graph
     */
    [[nodiscard]] Result<std::vector<std::string>> ordered_ids() const;

    /**
     * @brief Dependency-ordered migrations not yet in applied
     *
     * A dependency outside the graph is accepted only if already applied.
     * @return MIGRATION_CONFLICT on a cycle, an unknown dependency, or an
     *         applied migration whose in-graph dependency is not applied
     */
    [[nodiscard]] Result<std::vector<std::string>> plan(const std::set<std::string>& applied) const;

    [[nodiscard]] MigrationCategory category() const { return category_; }
    [[nodiscard]] size_t size() const { return migrations_.size(); }
    [[nodiscard]] bool empty() const { return migrations_.empty(); }

private:
    [[nodiscard]] Result<std::vector<std::string>> topological_order(
        const std::set<std::string>& applied) const;

    MigrationCategory category_;
    std::map<std::string, Migration> migrations_;
};

} // namespace pgtenant
