#include "admin/admin_commands.hpp"
#include "admin/runtime.hpp"
#include "core/utils.hpp"
#include "migration/migration_loader.hpp"
#include "migration/migration_tracker.hpp"
#include "tenant/schema_lifecycle_manager.hpp"
#include "tenant/tenant_registry.hpp"

#include <charconv>
#include <format>
#include <ostream>

namespace pgtenant {

namespace {

constexpr std::string_view kUsage =
    "usage: pgtenant-admin [--config FILE] <command> [args]\n"
    "\n"
    "commands:\n"
    "  register-tenant IDENTIFIER [SCHEMA]     register a tenant (provisioning)\n"
    "  create-tenant-schema IDENTIFIER         create and migrate its schema, then activate\n"
    "  makemigrations-tenant IDENTIFIER [NAME] write a new empty tenant migration\n"
    "  migrate-tenant IDENTIFIER|all [--workers N] [--json]\n"
    "                                          apply tenant migrations\n"
    "  migrate-shared                          apply shared migrations to the shared schema\n"
    "  suspend-tenant IDENTIFIER\n"
    "  activate-tenant IDENTIFIER\n"
    "  decommission-tenant IDENTIFIER          mark dropped; the schema is kept\n"
    "  drop-tenant-schema IDENTIFIER --confirm SCHEMA\n"
    "  list-tenants [STATUS]\n";

const std::vector<std::string_view> kCommands = {
    "register-tenant", "create-tenant-schema", "makemigrations-tenant",
    "migrate-tenant", "migrate-shared", "suspend-tenant", "activate-tenant",
    "decommission-tenant", "drop-tenant-schema", "list-tenants",
};

std::string format_record(const TenantRecord& r) {
    return std::format("{:<24} {:<24} {:<13} {}",
                       r.identifier, r.schema_name, tenant_status_name(r.status),
                       utils::format_timestamp(r.updated_at));
}

} // anonymous namespace

Result<CommandLine> parse_command_line(const std::vector<std::string>& argv) {
    CommandLine cl;
    size_t i = 0;
    while (i < argv.size()) {
        const auto& arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argv.size()) {
                return Result<CommandLine>::error(ErrorCode::CONFIGURATION_ERROR,
                                                  "--config requires a file argument");
            }
            cl.config_path = argv[i + 1];
            i += 2;
        } else if (arg.starts_with("--config=")) {
            cl.config_path = arg.substr(9);
            ++i;
        } else {
            break;
        }
    }
    if (i >= argv.size()) {
        return Result<CommandLine>::error(ErrorCode::CONFIGURATION_ERROR, "missing command");
    }
    cl.command = argv[i++];
    cl.args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i), argv.end());
    return Result<CommandLine>::ok(std::move(cl));
}

bool is_known_command(const std::string& command) {
    for (const auto c : kCommands) {
        if (c == command) return true;
    }
    return false;
}

void print_usage(std::ostream& out) {
    out << kUsage;
}

AdminCommands::AdminCommands(Runtime& runtime, std::ostream& out, std::ostream& err)
    : rt_(runtime), out_(out), err_(err) {}

int AdminCommands::fail(ErrorCode code, const std::string& message) {
    err_ << "error: " << error_code_name(code) << ": " << message << "\n";
    return kExitFailure;
}

int AdminCommands::usage(const std::string& message) {
    err_ << "error: " << message << "\n\n" << kUsage;
    return kExitUsage;
}

int AdminCommands::run(const std::string& command, const std::vector<std::string>& args,
                       std::stop_token stop) {
    if (command == "register-tenant")        return register_tenant(args);
    if (command == "create-tenant-schema")   return create_tenant_schema(args);
    if (command == "makemigrations-tenant")  return make_migrations(args);
    if (command == "migrate-tenant")         return migrate_tenant(args, stop);
    if (command == "migrate-shared")         return migrate_shared(args);
    if (command == "suspend-tenant" || command == "activate-tenant") {
        return set_status(command, args);
    }
    if (command == "decommission-tenant")    return decommission(args);
    if (command == "drop-tenant-schema")     return drop_schema(args);
    if (command == "list-tenants")           return list_tenants(args);
    return usage(std::format("unknown command '{}'", command));
}

int AdminCommands::register_tenant(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        return usage("register-tenant takes IDENTIFIER [SCHEMA]");
    }
    const auto result = args.size() == 2
        ? rt_.registry->register_tenant(args[0], args[1])
        : rt_.registry->register_tenant(args[0]);
    if (result.is_error()) {
        return fail(result.error_code(), result.error_message());
    }
    out_ << std::format("registered tenant '{}' (schema '{}', {})\n",
                        result.value().identifier, result.value().schema_name,
                        tenant_status_name(result.value().status));
    return kExitOk;
}

int AdminCommands::create_tenant_schema(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usage("create-tenant-schema takes IDENTIFIER");
    }
    const auto result = rt_.lifecycle->provision(args[0]);
    if (result.is_error()) {
        return fail(result.error_code(), result.error_message());
    }
    out_ << std::format("tenant '{}' is active in schema '{}'\n",
                        result.value().identifier, result.value().schema_name);
    return kExitOk;
}

int AdminCommands::make_migrations(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        return usage("makemigrations-tenant takes IDENTIFIER [NAME]");
    }
    const auto tenant = rt_.registry->get(args[0]);
    if (tenant.is_error()) {
        return fail(tenant.error_code(), tenant.error_message());
    }
    if (tenant.value().status == TenantStatus::DROPPED) {
        return fail(ErrorCode::TENANT_NOT_FOUND,
                    std::format("tenant '{}' has been decommissioned", args[0]));
    }

    const auto path = generate_migration(rt_.config.migrations.tenant_dir,
                                         rt_.lifecycle->tenant_graph(),
                                         args.size() == 2 ? args[1] : std::string{});
    if (path.is_error()) {
        return fail(path.error_code(), path.error_message());
    }
    out_ << std::format("created {}\n", path.value());
    return kExitOk;
}

int AdminCommands::migrate_tenant(const std::vector<std::string>& args, std::stop_token stop) {
    std::string target;
    size_t workers = rt_.config.migrations.bulk_workers;
    bool as_json = false;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--json") {
            as_json = true;
        } else if (args[i] == "--workers") {
            if (i + 1 >= args.size()) {
                return usage("--workers requires a number");
            }
            const auto& n = args[++i];
            const auto [ptr, ec] = std::from_chars(n.data(), n.data() + n.size(), workers);
            if (ec != std::errc{} || ptr != n.data() + n.size() || workers == 0) {
                return usage(std::format("--workers expects a positive number, got '{}'", n));
            }
        } else if (target.empty()) {
            target = args[i];
        } else {
            return usage(std::format("unexpected argument '{}'", args[i]));
        }
    }
    if (target.empty()) {
        return usage("migrate-tenant takes IDENTIFIER or 'all'");
    }

    if (target != "all") {
        const auto applied = rt_.lifecycle->migrate_tenant(target);
        if (applied.is_error()) {
            return fail(applied.error_code(), applied.error_message());
        }
        if (applied.value().empty()) {
            out_ << std::format("tenant '{}' is up to date\n", target);
        } else {
            out_ << std::format("tenant '{}': applied {}\n", target, utils::join(applied.value(), ", "));
        }
        return kExitOk;
    }

    const auto report = rt_.lifecycle->migrate_all_tenants(
        MigrationStateTracker::BulkOptions{.max_workers = workers, .stop_token = stop});
    if (report.is_error()) {
        return fail(report.error_code(), report.error_message());
    }
    out_ << (as_json ? report.value().to_json() + "\n" : report.value().to_text());
    return report.value().all_succeeded() ? kExitOk : kExitFailure;
}

int AdminCommands::migrate_shared(const std::vector<std::string>& args) {
    if (!args.empty()) {
        return usage("migrate-shared takes no arguments");
    }
    const auto applied = rt_.lifecycle->migrate_shared();
    if (applied.is_error()) {
        return fail(applied.error_code(), applied.error_message());
    }
    if (applied.value().empty()) {
        out_ << "shared schema is up to date\n";
    } else {
        out_ << std::format("shared schema: applied {}\n", utils::join(applied.value(), ", "));
    }
    return kExitOk;
}

int AdminCommands::set_status(const std::string& command, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usage(std::format("{} takes IDENTIFIER", command));
    }
    const auto result = command == "suspend-tenant"
        ? rt_.registry->mark_suspended(args[0])
        : rt_.registry->mark_active(args[0]);
    if (result.is_error()) {
        return fail(result.error_code(), result.error_message());
    }
    out_ << std::format("tenant '{}' is {}\n", args[0],
                        command == "suspend-tenant" ? "suspended" : "active");
    return kExitOk;
}

int AdminCommands::decommission(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usage("decommission-tenant takes IDENTIFIER");
    }
    const auto result = rt_.lifecycle->decommission(args[0]);
    if (result.is_error()) {
        return fail(result.error_code(), result.error_message());
    }
    out_ << std::format("tenant '{}' decommissioned; its schema is kept until drop-tenant-schema\n",
                        args[0]);
    return kExitOk;
}

int AdminCommands::drop_schema(const std::vector<std::string>& args) {
    if (args.size() != 3 || args[1] != "--confirm") {
        return usage("drop-tenant-schema takes IDENTIFIER --confirm SCHEMA");
    }
    const auto result = rt_.lifecycle->drop_schema(args[0], args[2]);
    if (result.is_error()) {
        return fail(result.error_code(), result.error_message());
    }
    out_ << std::format("dropped schema '{}'\n", args[2]);
    return kExitOk;
}

int AdminCommands::list_tenants(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return usage("list-tenants takes [STATUS]");
    }
    std::optional<TenantStatus> status;
    if (!args.empty()) {
        status = parse_tenant_status(utils::to_lower(args[0]));
        if (!status) {
            return usage(std::format("unknown status '{}'", args[0]));
        }
    }

    constexpr size_t kPageSize = 100;
    TenantListPosition after;
    size_t total = 0;
    while (true) {
        const auto page = rt_.registry->list(status, after, kPageSize);
        if (page.is_error()) {
            return fail(page.error_code(), page.error_message());
        }
        for (const auto& record : page.value()) {
            out_ << format_record(record) << "\n";
        }
        total += page.value().size();
        if (page.value().size() < kPageSize) break;
        after = TenantListPosition::after(page.value().back());
    }
    out_ << std::format("{} tenant(s)\n", total);
    return kExitOk;
}

} // namespace pgtenant
