#include "migration/migration_report.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>

namespace pgtenant {

using json = nlohmann::json;

size_t MigrationReport::count(SchemaOutcome outcome) const {
    return static_cast<size_t>(std::count_if(schemas.begin(), schemas.end(),
        [outcome](const SchemaMigrationResult& r) { return r.outcome == outcome; }));
}

const SchemaMigrationResult* MigrationReport::find(const std::string& schema_name) const {
    for (const auto& r : schemas) {
        if (r.schema_name == schema_name) return &r;
    }
    return nullptr;
}

std::string MigrationReport::to_text() const {
    std::string out;
    for (const auto& r : schemas) {
        switch (r.outcome) {
            case SchemaOutcome::SUCCEEDED:
                out += std::format("{:<32} succeeded  {} applied{}\n", r.schema_name, r.applied.size(),
                    r.applied.empty() ? "" : " (" + utils::join(r.applied, ", ") + ")");
                break;
            case SchemaOutcome::FAILED:
                out += std::format("{:<32} FAILED     {}: {}\n", r.schema_name,
                                   error_code_name(r.error_code), r.error_message);
                break;
            case SchemaOutcome::SKIPPED:
                if (r.error_code == ErrorCode::NONE) {
                    out += std::format("{:<32} skipped\n", r.schema_name);
                } else {
                    out += std::format("{:<32} skipped    {}: {}\n", r.schema_name,
                                       error_code_name(r.error_code), r.error_message);
                }
                break;
        }
    }
    out += std::format("{} schemas: {} succeeded, {} failed, {} skipped\n",
                       schemas.size(), count(SchemaOutcome::SUCCEEDED),
                       count(SchemaOutcome::FAILED), count(SchemaOutcome::SKIPPED));
    return out;
}

std::string MigrationReport::to_json() const {
    json root;
    root["total"] = schemas.size();
    root["succeeded"] = count(SchemaOutcome::SUCCEEDED);
    root["failed"] = count(SchemaOutcome::FAILED);
    root["skipped"] = count(SchemaOutcome::SKIPPED);

    json items = json::array();
    for (const auto& r : schemas) {
        json item;
        item["schema"] = r.schema_name;
        item["outcome"] = std::string(schema_outcome_name(r.outcome));
        item["applied"] = r.applied;
        item["duration_ms"] = r.duration_ms;
        if (r.error_code != ErrorCode::NONE) {
            item["error"] = {
                {"code", std::string(error_code_name(r.error_code))},
                {"message", r.error_message},
            };
        }
        items.push_back(std::move(item));
    }
    root["schemas"] = std::move(items);
    return root.dump(2);
}

} // namespace pgtenant
