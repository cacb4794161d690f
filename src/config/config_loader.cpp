#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "tenant/schema_name.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace pgtenant {

std::string TenancyConfig::registry_table() const {
    std::string table = utils::to_lower(tenant_model);
    for (char& c : table) {
        if (c == '.') c = '_';
    }
    return table;
}

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables; unset expands empty
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, val] : *tbl) expand_env_vars_in_node(val);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_env_vars_in_node(elem);
    }
}

/**
 * @brief Deep-merge overlay into base; overlay wins for scalars and arrays
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        auto* base_tbl = base[key].as_table();
        if (val.is_table() && base_tbl) {
            merge_tables(*base_tbl, *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

// include_stack holds the files currently being expanded; a file may be
// included again from a sibling branch, only not from inside itself
void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& include_stack, int depth) {
    namespace fs = std::filesystem;

    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (const auto* s = inc_node.as_string()) {
        paths.emplace_back(s->get());
    } else if (const auto* arr = inc_node.as_array()) {
        for (const auto& item : *arr) {
            if (const auto* s = item.as_string()) paths.emplace_back(s->get());
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        const auto abs_path = fs::canonical(base_dir / rel_path);
        if (!include_stack.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), include_stack, depth + 1);
        include_stack.erase(abs_path.string());

        // Included file is the base, the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in_node(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;

    auto result = toml::parse_file(file_path);
    std::unordered_set<std::string> include_stack;
    include_stack.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), include_stack, 0);

    expand_env_vars_in_node(result);
    return result;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.min_connections = static_cast<size_t>(d["min_connections"].value_or(2));
    cfg.max_connections = static_cast<size_t>(d["max_connections"].value_or(10));
    cfg.connection_timeout = std::chrono::milliseconds(d["connection_timeout_ms"].value_or(5000));
    cfg.idle_timeout_seconds = static_cast<uint32_t>(d["idle_timeout_seconds"].value_or(300));
    cfg.max_lifetime_seconds = static_cast<uint32_t>(d["max_lifetime_seconds"].value_or(3600));
    cfg.health_check_query = d["health_check_query"].value_or("SELECT 1"s);
    cfg.verify_session_on_release = d["verify_session_on_release"].value_or(true);
    return cfg;
}

TenancyConfig ConfigLoader::extract_tenancy(const toml::table& root) {
    TenancyConfig cfg;
    const auto* tenancy = root["tenancy"].as_table();
    if (!tenancy) return cfg;
    const auto& t = *tenancy;

    cfg.tenant_model = t["tenant_model"].value_or(""s);
    cfg.tenant_identifier_field = t["tenant_identifier_field"].value_or("identifier"s);
    cfg.public_schema_name = t["public_schema_name"].value_or("public"s);
    cfg.include_public_in_search_path = t["include_public_in_search_path"].value_or(true);
    return cfg;
}

AppsConfig ConfigLoader::extract_apps(const toml::table& root) {
    AppsConfig cfg;
    const auto* apps = root["apps"].as_table();
    if (!apps) return cfg;

    cfg.shared = toml_string_array(*apps, "shared");
    cfg.tenant = toml_string_array(*apps, "tenant");
    cfg.entities = toml_string_array(*apps, "entities");
    return cfg;
}

MigrationsConfig ConfigLoader::extract_migrations(const toml::table& root) {
    MigrationsConfig cfg;
    const auto* migrations = root["migrations"].as_table();
    if (!migrations) return cfg;
    const auto& m = *migrations;

    cfg.shared_dir = m["shared_dir"].value_or(cfg.shared_dir);
    cfg.tenant_dir = m["tenant_dir"].value_or(cfg.tenant_dir);
    cfg.ledger_table = m["ledger_table"].value_or(cfg.ledger_table);
    cfg.bulk_workers = static_cast<size_t>(m["bulk_workers"].value_or(4));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

PgTenantConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    PgTenantConfig config;
    config.database = extract_database(tbl);
    config.tenancy = extract_tenancy(tbl);
    config.apps = extract_apps(tbl);
    config.migrations = extract_migrations(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PgTenantConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PgTenantConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (db.connection_string.empty()) {
        errors.push_back("database.connection_string must not be empty");
    }
    if (db.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format("database.min_connections ({}) > max_connections ({})",
                                     db.min_connections, db.max_connections));
    }

    const auto& t = config.tenancy;
    if (t.tenant_model.empty()) {
        errors.push_back("tenancy.tenant_model must be set (app.entity)");
    } else if (t.tenant_model.find('.') == std::string::npos) {
        errors.push_back(std::format("tenancy.tenant_model '{}' must be of the form app.entity",
                                     t.tenant_model));
    } else if (!is_safe_identifier(t.registry_table())) {
        errors.push_back(std::format("tenancy.tenant_model '{}' does not map to a valid table name",
                                     t.tenant_model));
    }
    if (!is_safe_identifier(t.tenant_identifier_field)) {
        errors.push_back(std::format("tenancy.tenant_identifier_field '{}' must match [a-z0-9_]{{1,63}}",
                                     t.tenant_identifier_field));
    }
    if (!is_safe_identifier(t.public_schema_name)) {
        errors.push_back(std::format("tenancy.public_schema_name '{}' must match [a-z0-9_]{{1,63}}",
                                     t.public_schema_name));
    }

    if (config.apps.entities.empty()) {
        errors.push_back("apps.entities must declare at least the tenant model");
    }

    const auto& m = config.migrations;
    if (!is_safe_identifier(m.ledger_table)) {
        errors.push_back(std::format("migrations.ledger_table '{}' must match [a-z0-9_]{{1,63}}",
                                     m.ledger_table));
    }
    if (m.bulk_workers == 0) {
        errors.push_back("migrations.bulk_workers must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error, critical",
                                     config.logging.level));
    }

    return errors;
}

} // namespace pgtenant
