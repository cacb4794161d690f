#pragma once

#include "core/error.hpp"
#include "migration/migration.hpp"
#include <optional>
#include <string>

namespace pgtenant {

/**
 * @brief Builds migration graphs from a directory of SQL files
 *
 * File layout: <dir>/<NNNN>_<name>.sql, where the id is the file stem.
 * Leading comment lines may declare dependencies:
 *
 *   -- depends: 0001_init, 0002_widgets
 *
 * A file without a depends line depends on the previous file in lexical
 * order. An empty depends line declares a root. Other files are ignored.
 */
class MigrationLoader {
public:
    /**
     * @brief Load every migration file in dir into a graph of category
     *
     * A missing directory yields an empty graph.
     * @return MIGRATION_CONFLICT for a duplicate id, CONFIGURATION_ERROR if
     *         dir is not a directory or a file cannot be read
     */
    [[nodiscard]] static Result<MigrationGraph> load_directory(const std::string& dir,
                                                               MigrationCategory category);

    /**
     * @brief Parse one migration from its file stem and contents
     * @param previous id implied as the dependency when no header is present
     */
    [[nodiscard]] static Migration parse(const std::string& id,
                                         const std::string& contents,
                                         const std::optional<std::string>& previous);

    /**
     * @brief True for names of the form NNNN_name.sql
     */
    [[nodiscard]] static bool is_migration_file(const std::string& filename);
};

/**
 * @brief Writes a new empty migration that depends on the graph's leaves
 *
 * The number is one past the highest existing number in dir. When name is
 * empty an "auto_<UTC timestamp>" name is used.
 * @return Path of the written file; INVALID_IDENTIFIER for a bad name,
 *         CONFIGURATION_ERROR on I/O failure
 */
[[nodiscard]] Result<std::string> generate_migration(const std::string& dir,
                                                     const MigrationGraph& graph,
                                                     const std::string& name);

} // namespace pgtenant
