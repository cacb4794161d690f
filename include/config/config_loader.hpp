#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace pgtenant {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Every string value may reference environment variables as ${NAME}.
 * A top-level `include = ["base.toml"]` merges other files underneath the
 * including one (paths relative to it; the including file wins).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PgTenantConfig config;

        static LoadResult ok(PgTenantConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to pgtenant.toml
     * @return LoadResult with parsed config or every validation error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const PgTenantConfig& config);

private:
    static PgTenantConfig extract_all_sections(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static TenancyConfig extract_tenancy(const toml::table& root);
    static AppsConfig extract_apps(const toml::table& root);
    static MigrationsConfig extract_migrations(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(PgTenantConfig config);
};

} // namespace pgtenant
