#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sql_state;      // Five-character SQLSTATE on failure

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;
};

namespace sql_state {
inline constexpr const char* kUniqueViolation = "23505";
inline constexpr const char* kDuplicateSchema = "42P06";
inline constexpr const char* kInvalidSchemaName = "3F000";
} // namespace sql_state

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; a connection belongs to exactly one
 * unit of work between acquire and release.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement (simple query protocol)
     * @param sql SQL text, may contain several statements
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a single statement with out-of-line parameters ($1, $2, ...)
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql,
                                              const std::vector<std::string>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief True while a transaction block is open (including failed blocks)
     */
    [[nodiscard]] virtual bool in_transaction() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace pgtenant
