#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pgtenant {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;
    size_t min_connections = 2;
    size_t max_connections = 10;
    std::chrono::milliseconds connection_timeout{5000};
    uint32_t idle_timeout_seconds = 300;
    uint32_t max_lifetime_seconds = 3600;       // 0 = never recycle
    std::string health_check_query{"SELECT 1"};
    bool verify_session_on_release = true;      // Compare search_path on every release
};

struct TenancyConfig {
    std::string tenant_model;                   // "customers.client"
    std::string tenant_identifier_field{"identifier"};
    std::string public_schema_name{"public"};
    bool include_public_in_search_path = true;

    /**
     * @brief Registry table name: tenant_model with '.' replaced by '_'
     */
    [[nodiscard]] std::string registry_table() const;
};

struct AppsConfig {
    std::vector<std::string> shared;            // SHARED_APPS: app labels or app.entity
    std::vector<std::string> tenant;            // TENANT_APPS
    std::vector<std::string> entities;          // Every declared app.entity
};

struct MigrationsConfig {
    std::string shared_dir{"migrations/shared"};
    std::string tenant_dir{"migrations/tenant"};
    std::string ledger_table{"pgtenant_migrations"};
    size_t bulk_workers = 4;
};

struct LoggingConfig {
    std::string level{"info"};
};

struct PgTenantConfig {
    DatabaseConfig database;
    TenancyConfig tenancy;
    AppsConfig apps;
    MigrationsConfig migrations;
    LoggingConfig logging;
};

} // namespace pgtenant
