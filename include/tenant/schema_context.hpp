#pragma once

#include "core/error.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pgtenant {

class TenantRegistry;

/**
 * @brief Active-schema stack of one unit of work (request, job, CLI run)
 *
 * Owned by the unit of work and passed explicitly; there is no global or
 * thread-global instance. Not thread-safe: a unit of work uses its context
 * from one thread at a time.
 */
class SchemaContext {
public:
    [[nodiscard]] std::optional<std::string> current() const;

    void push(std::string schema_name);

    /**
     * @brief Pop the innermost binding, restoring its parent
     * @return false if the stack was already empty
     */
    bool pop();

    [[nodiscard]] size_t depth() const { return stack_.size(); }
    [[nodiscard]] bool empty() const { return stack_.empty(); }

private:
    std::vector<std::string> stack_;
};

/**
 * @brief Pushes on construction, pops on destruction
 */
class ScopedSchema {
public:
    ScopedSchema(SchemaContext& context, std::string schema_name);
    ~ScopedSchema();

    ScopedSchema(ScopedSchema&& other) noexcept;
    ScopedSchema& operator=(ScopedSchema&&) = delete;
    ScopedSchema(const ScopedSchema&) = delete;
    ScopedSchema& operator=(const ScopedSchema&) = delete;

private:
    SchemaContext* context_;
};

/**
 * @brief Resolve identifier through the registry and push its schema
 *
 * This is the explicit "switch schema" entry point called at the start of a
 * unit of work; the returned guard pops at teardown.
 */
[[nodiscard]] Result<ScopedSchema> activate_tenant(SchemaContext& context,
                                                   const TenantRegistry& registry,
                                                   const std::string& identifier);

} // namespace pgtenant
