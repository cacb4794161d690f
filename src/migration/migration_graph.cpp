#include "migration/migration.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace pgtenant {

Status MigrationGraph::add(Migration migration) {
    if (migration.id.empty()) {
        return Status::error(ErrorCode::MIGRATION_CONFLICT, "migration id must not be empty");
    }
    if (migrations_.contains(migration.id)) {
        return Status::error(ErrorCode::MIGRATION_CONFLICT,
            std::format("duplicate {} migration '{}'",
                        migration_category_name(category_), migration.id));
    }
    auto id = migration.id;
    migrations_.emplace(std::move(id), std::move(migration));
    return Status::ok();
}

const Migration* MigrationGraph::find(const std::string& id) const {
    const auto it = migrations_.find(id);
    return it == migrations_.end() ? nullptr : &it->second;
}

std::vector<std::string> MigrationGraph::ids() const {
    std::vector<std::string> result;
    result.reserve(migrations_.size());
    for (const auto& [id, m] : migrations_) {
        result.push_back(id);
    }
    return result;
}

std::vector<std::string> MigrationGraph::leaf_nodes() const {
    std::set<std::string> depended_on;
    for (const auto& [id, m] : migrations_) {
        depended_on.insert(m.dependencies.begin(), m.dependencies.end());
    }
    std::vector<std::string> leaves;
    for (const auto& [id, m] : migrations_) {
        if (!depended_on.contains(id)) leaves.push_back(id);
    }
    return leaves;
}

Result<std::vector<std::string>> MigrationGraph::ordered_ids() const {
    return topological_order({});
}

Result<std::vector<std::string>> MigrationGraph::topological_order(
    const std::set<std::string>& applied) const {

    // Kahn's algorithm over in-graph edges; the ordered ready set keeps the
    // result deterministic.
    std::unordered_map<std::string, size_t> in_degree;
    std::unordered_map<std::string, std::vector<std::string>> dependents;

    for (const auto& [id, m] : migrations_) {
        in_degree.try_emplace(id, 0);
        for (const auto& dep : m.dependencies) {
            if (dep == id) {
                return Result<std::vector<std::string>>::error(ErrorCode::MIGRATION_CONFLICT,
                    std::format("migration '{}' depends on itself", id));
            }
            if (!migrations_.contains(dep)) {
                if (applied.contains(dep)) continue;
                return Result<std::vector<std::string>>::error(ErrorCode::MIGRATION_CONFLICT,
                    std::format("migration '{}' depends on unknown migration '{}'", id, dep));
            }
            ++in_degree[id];
            dependents[dep].push_back(id);
        }
    }

    std::set<std::string> ready;
    for (const auto& [id, degree] : in_degree) {
        if (degree == 0) ready.insert(id);
    }

    std::vector<std::string> order;
    order.reserve(migrations_.size());
    while (!ready.empty()) {
        auto id = *ready.begin();
        ready.erase(ready.begin());
        for (const auto& next : dependents[id]) {
            if (--in_degree[next] == 0) ready.insert(next);
        }
        order.push_back(std::move(id));
    }

    if (order.size() != migrations_.size()) {
        std::vector<std::string> stuck;
        for (const auto& [id, degree] : in_degree) {
            if (degree > 0) stuck.push_back(id);
        }
        std::sort(stuck.begin(), stuck.end());
        return Result<std::vector<std::string>>::error(ErrorCode::MIGRATION_CONFLICT,
            std::format("dependency cycle among migrations: {}", utils::join(stuck, ", ")));
    }
    return Result<std::vector<std::string>>::ok(std::move(order));
}

Result<std::vector<std::string>> MigrationGraph::plan(const std::set<std::string>& applied) const {
    auto order = topological_order(applied);
    if (order.is_error()) {
        return order;
    }

    // Ledger must be prefix-closed: nothing recorded ahead of its ancestors
    for (const auto& id : applied) {
        const auto* m = find(id);
        if (!m) continue;
        for (const auto& dep : m->dependencies) {
            if (migrations_.contains(dep) && !applied.contains(dep)) {
                return Result<std::vector<std::string>>::error(ErrorCode::MIGRATION_CONFLICT,
                    std::format("inconsistent history: '{}' is applied but its dependency '{}' is not",
                                id, dep));
            }
        }
    }

    std::vector<std::string> pending;
    for (auto& id : order.value()) {
        if (!applied.contains(id)) pending.push_back(std::move(id));
    }
    return Result<std::vector<std::string>>::ok(std::move(pending));
}

} // namespace pgtenant
