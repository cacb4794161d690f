#pragma once

#include "core/error.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace pgtenant {

// PostgreSQL NAMEDATALEN - 1
inline constexpr size_t kMaxSchemaNameLength = 63;

/**
 * @brief True if name is 1..63 characters of [a-z0-9_]
 *
 * Schema names are interpolated into DDL and search_path values, so this is
 * the only gate between tenant input and SQL text.
 */
[[nodiscard]] bool is_safe_identifier(std::string_view name) noexcept;

/**
 * @brief Validate a tenant schema name
 *
 * Fails with INVALID_IDENTIFIER for unsafe names and for reserved ones: the
 * shared schema, information_schema and the pg_ prefix.
 */
[[nodiscard]] Status validate_schema_name(std::string_view name, std::string_view shared_schema);

/**
 * @brief Derive a schema name from a business identifier
 *
 * Lowercases, maps every character outside [a-z0-9_] to '_' and truncates to
 * 63 characters. The result still has to pass validate_schema_name().
 */
[[nodiscard]] std::string derive_schema_name(std::string_view identifier);

/**
 * @brief Double-quote an identifier, doubling embedded quotes
 */
[[nodiscard]] std::string quote_identifier(std::string_view name);

/**
 * @brief "schema"."table"
 */
[[nodiscard]] std::string qualified_name(std::string_view schema, std::string_view table);

} // namespace pgtenant
