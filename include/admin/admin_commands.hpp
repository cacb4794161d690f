#pragma once

#include "core/error.hpp"
#include <iosfwd>
#include <stop_token>
#include <string>
#include <vector>

namespace pgtenant {

struct Runtime;

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;      // Command ran and failed
inline constexpr int kExitUsage = 2;        // Bad arguments or fatal configuration

struct CommandLine {
    std::string config_path{"pgtenant.toml"};
    std::string command;
    std::vector<std::string> args;
};

/**
 * @brief Split argv into --config, the command and its arguments
 * @return CONFIGURATION_ERROR with a usage message on malformed input
 */
[[nodiscard]] Result<CommandLine> parse_command_line(const std::vector<std::string>& argv);

[[nodiscard]] bool is_known_command(const std::string& command);

void print_usage(std::ostream& out);

/**
 * @brief Administrative commands over a wired Runtime
 *
 * Results go to out, diagnostics to err; run() returns the process exit code.
 */
class AdminCommands {
public:
    AdminCommands(Runtime& runtime, std::ostream& out, std::ostream& err);

    /**
     * @param stop Cancels a bulk migrate-tenant run between schemas
     */
    int run(const std::string& command, const std::vector<std::string>& args,
            std::stop_token stop = {});

private:
    int register_tenant(const std::vector<std::string>& args);
    int create_tenant_schema(const std::vector<std::string>& args);
    int make_migrations(const std::vector<std::string>& args);
    int migrate_tenant(const std::vector<std::string>& args, std::stop_token stop);
    int migrate_shared(const std::vector<std::string>& args);
    int set_status(const std::string& command, const std::vector<std::string>& args);
    int decommission(const std::vector<std::string>& args);
    int drop_schema(const std::vector<std::string>& args);
    int list_tenants(const std::vector<std::string>& args);

    int fail(ErrorCode code, const std::string& message);
    int usage(const std::string& message);

    Runtime& rt_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace pgtenant
