#pragma once

#include "core/error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pgtenant {

enum class SchemaOutcome {
    SUCCEEDED,
    FAILED,
    SKIPPED     // Not started: the run was cancelled first
};

[[nodiscard]] constexpr std::string_view schema_outcome_name(SchemaOutcome o) noexcept {
    switch (o) {
        case SchemaOutcome::SUCCEEDED: return "succeeded";
        case SchemaOutcome::FAILED:    return "failed";
        case SchemaOutcome::SKIPPED:   return "skipped";
    }
    return "unknown";
}

struct SchemaMigrationResult {
    std::string schema_name;
    SchemaOutcome outcome = SchemaOutcome::SKIPPED;
    std::vector<std::string> applied;   // Migrations applied in this run
    ErrorCode error_code = ErrorCode::NONE;     // FAILED: the cause; SKIPPED: CANCELLED
    std::string error_message;
    double duration_ms = 0.0;
};

/**
 * @brief Per-schema outcome of a bulk migration run, in input order
 */
struct MigrationReport {
    std::vector<SchemaMigrationResult> schemas;

    [[nodiscard]] size_t count(SchemaOutcome outcome) const;
    [[nodiscard]] bool all_succeeded() const { return count(SchemaOutcome::SUCCEEDED) == schemas.size(); }
    [[nodiscard]] const SchemaMigrationResult* find(const std::string& schema_name) const;

    /**
     * @brief One line per schema plus a summary line
     */
    [[nodiscard]] std::string to_text() const;

    [[nodiscard]] std::string to_json() const;
};

} // namespace pgtenant
