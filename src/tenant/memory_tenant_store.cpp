#include "tenant/memory_tenant_store.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace pgtenant {

Result<TenantRecord> MemoryTenantStore::insert(TenantRecord record) {
    std::unique_lock lock(mutex_);

    for (const auto& existing : records_) {
        if (existing.status == TenantStatus::DROPPED) continue;
        if (existing.identifier == record.identifier) {
            return Result<TenantRecord>::error(ErrorCode::DUPLICATE_TENANT,
                std::format("tenant '{}' already registered", record.identifier));
        }
        if (existing.schema_name == record.schema_name) {
            return Result<TenantRecord>::error(ErrorCode::DUPLICATE_TENANT,
                std::format("schema '{}' already in use by tenant '{}'",
                            record.schema_name, existing.identifier));
        }
    }

    record.id = next_id_++;
    records_.push_back(record);
    return Result<TenantRecord>::ok(std::move(record));
}

Result<std::optional<TenantRecord>> MemoryTenantStore::find_by_identifier(
    const std::string& identifier) const {
    std::shared_lock lock(mutex_);

    std::optional<TenantRecord> dropped;
    for (const auto& r : records_) {
        if (r.identifier != identifier) continue;
        if (r.status != TenantStatus::DROPPED) {
            return Result<std::optional<TenantRecord>>::ok(r);
        }
        dropped = r;    // Later ids win
    }
    return Result<std::optional<TenantRecord>>::ok(std::move(dropped));
}

Result<std::optional<TenantRecord>> MemoryTenantStore::find_by_schema(
    const std::string& schema_name) const {
    std::shared_lock lock(mutex_);

    for (const auto& r : records_) {
        if (r.schema_name == schema_name && r.status != TenantStatus::DROPPED) {
            return Result<std::optional<TenantRecord>>::ok(r);
        }
    }
    return Result<std::optional<TenantRecord>>::ok(std::nullopt);
}

Result<bool> MemoryTenantStore::update_status(uint64_t id, TenantStatus expected, TenantStatus next,
                                              std::chrono::system_clock::time_point updated_at) {
    std::unique_lock lock(mutex_);

    const auto it = std::find_if(records_.begin(), records_.end(),
                                 [id](const TenantRecord& r) { return r.id == id; });
    if (it == records_.end() || it->status != expected) {
        return Result<bool>::ok(false);
    }
    it->status = next;
    it->updated_at = updated_at;
    return Result<bool>::ok(true);
}

Result<std::vector<TenantRecord>> MemoryTenantStore::list(std::optional<TenantStatus> status,
                                                          const TenantListPosition& after,
                                                          size_t limit) const {
    std::vector<TenantRecord> matches;
    {
        std::shared_lock lock(mutex_);
        for (const auto& r : records_) {
            if (status && r.status != *status) continue;
            if (!after.precedes(r)) continue;
            matches.push_back(r);
        }
    }

    std::sort(matches.begin(), matches.end(), [](const TenantRecord& a, const TenantRecord& b) {
        return a.identifier != b.identifier ? a.identifier < b.identifier : a.id < b.id;
    });
    if (matches.size() > limit) {
        matches.resize(limit);
    }
    return Result<std::vector<TenantRecord>>::ok(std::move(matches));
}

size_t MemoryTenantStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace pgtenant
