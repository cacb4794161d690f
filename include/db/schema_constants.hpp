#pragma once

#include <string_view>

namespace pgtenant::db {

// Session search_path read/write. set_config with is_local=false lasts for the
// session, which is what a pooled connection carries between units of work.
inline constexpr std::string_view kShowSearchPath =
    "SELECT pg_catalog.current_setting('search_path')";
inline constexpr std::string_view kSetSearchPath =
    "SELECT pg_catalog.set_config('search_path', $1, false)";

inline constexpr std::string_view kBegin    = "BEGIN";
inline constexpr std::string_view kCommit   = "COMMIT";
inline constexpr std::string_view kRollback = "ROLLBACK";

// Prefixes; the savepoint name is appended
inline constexpr std::string_view kSavepoint           = "SAVEPOINT ";
inline constexpr std::string_view kRollbackToSavepoint = "ROLLBACK TO SAVEPOINT ";
inline constexpr std::string_view kReleaseSavepoint    = "RELEASE SAVEPOINT ";

inline constexpr std::string_view kSchemaExists =
    "SELECT 1 FROM pg_catalog.pg_namespace WHERE nspname = $1";
inline constexpr std::string_view kTableExists =
    "SELECT 1 FROM pg_catalog.pg_tables WHERE schemaname = $1 AND tablename = $2";

} // namespace pgtenant::db
