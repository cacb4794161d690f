#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace pgtenant;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "pgtenant_test_config") {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

constexpr const char* kMinimal = R"(
[database]
connection_string = "host=localhost dbname=app"

[tenancy]
tenant_model = "customers.client"

[apps]
shared = ["customers"]
tenant = ["shop"]
entities = ["customers.client", "shop.order"]
)";

} // namespace

TEST_CASE("ConfigLoader: minimal config takes defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimal);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.database.connection_string == "host=localhost dbname=app");
    CHECK(cfg.database.min_connections == 2);
    CHECK(cfg.database.max_connections == 10);
    CHECK(cfg.database.connection_timeout == std::chrono::milliseconds(5000));
    CHECK(cfg.database.max_lifetime_seconds == 3600);
    CHECK(cfg.database.verify_session_on_release);

    CHECK(cfg.tenancy.tenant_model == "customers.client");
    CHECK(cfg.tenancy.tenant_identifier_field == "identifier");
    CHECK(cfg.tenancy.public_schema_name == "public");
    CHECK(cfg.tenancy.include_public_in_search_path);

    CHECK(cfg.apps.shared == std::vector<std::string>{"customers"});
    CHECK(cfg.apps.tenant == std::vector<std::string>{"shop"});
    CHECK(cfg.apps.entities.size() == 2);

    CHECK(cfg.migrations.shared_dir == "migrations/shared");
    CHECK(cfg.migrations.tenant_dir == "migrations/tenant");
    CHECK(cfg.migrations.ledger_table == "pgtenant_migrations");
    CHECK(cfg.migrations.bulk_workers == 4);
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("ConfigLoader: explicit values override defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[migrations]
tenant_dir = "db/tenant"
bulk_workers = 8

[logging]
level = "debug"
)");
    REQUIRE(result.success);
    CHECK(result.config.migrations.tenant_dir == "db/tenant");
    CHECK(result.config.migrations.shared_dir == "migrations/shared");
    CHECK(result.config.migrations.bulk_workers == 8);
    CHECK(result.config.logging.level == "debug");
}

TEST_CASE("ConfigLoader: every validation error is reported", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
min_connections = 20
max_connections = 5

[tenancy]
tenant_model = "client"
public_schema_name = "Public Schema"

[migrations]
bulk_workers = 0
)");
    REQUIRE_FALSE(result.success);

    const auto& msg = result.error_message;
    CHECK(msg.find("database.connection_string") != std::string::npos);
    CHECK(msg.find("min_connections (20) > max_connections (5)") != std::string::npos);
    CHECK(msg.find("app.entity") != std::string::npos);
    CHECK(msg.find("public_schema_name") != std::string::npos);
    CHECK(msg.find("apps.entities") != std::string::npos);
    CHECK(msg.find("bulk_workers") != std::string::npos);
}

TEST_CASE("ConfigLoader: unknown log level is rejected", "[config]") {
    auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[logging]
level = "verbose"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("logging.level 'verbose'") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[database\nconnection_string = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config][env]") {
    ::setenv("PGTENANT_TEST_DB", "billing", 1);
    ::unsetenv("PGTENANT_TEST_UNSET");

    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=db dbname=${PGTENANT_TEST_DB}${PGTENANT_TEST_UNSET}"

[tenancy]
tenant_model = "customers.client"

[apps]
entities = ["customers.client"]
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=db dbname=billing");

    ::unsetenv("PGTENANT_TEST_DB");
}

TEST_CASE("ConfigLoader: unclosed substitution is an error", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "dbname=${BROKEN"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: included file is overridden by the including one", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", R"(
[database]
connection_string = "host=base"
max_connections = 30

[tenancy]
tenant_model = "customers.client"

[apps]
entities = ["customers.client"]
)");
    const auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[database]
connection_string = "host=main"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=main");
    CHECK(result.config.database.max_connections == 30);
    CHECK(result.config.tenancy.tenant_model == "customers.client");
}

TEST_CASE("ConfigLoader: circular include is detected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigLoader: file included along two branches is not circular", "[config][include]") {
    TmpDir tmp;
    tmp.file("common.toml", R"(
[database]
connection_string = "host=common"
max_connections = 30

[tenancy]
tenant_model = "customers.client"

[apps]
entities = ["customers.client"]
)");
    tmp.file("pool.toml", "include = \"common.toml\"\n\n[database]\nmin_connections = 3\n");
    tmp.file("logs.toml", "include = \"common.toml\"\n\n[logging]\nlevel = \"debug\"\n");
    const auto main_path = tmp.file("main.toml", R"(
include = ["pool.toml", "logs.toml"]

[database]
connection_string = "host=main"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=main");
    CHECK(result.config.database.max_connections == 30);
    CHECK(result.config.database.min_connections == 3);
    CHECK(result.config.logging.level == "debug");
    CHECK(result.config.tenancy.tenant_model == "customers.client");
}

TEST_CASE("ConfigLoader: file including itself further down is circular", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"c.toml\"\n");
    tmp.file("c.toml", "include = \"b.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
    CHECK(result.error_message.find("b.toml") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/pgtenant.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

TEST_CASE("TenancyConfig: registry table follows the tenant model", "[config]") {
    TenancyConfig t;
    t.tenant_model = "customers.client";
    CHECK(t.registry_table() == "customers_client");

    t.tenant_model = "Billing.Account";
    CHECK(t.registry_table() == "billing_account");
}
