#include "admin/admin_commands.hpp"
#include "admin/runtime.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"

#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <stop_token>

using namespace pgtenant;

// Global stop source for signal handling: a bulk migration stops taking new
// schemas, the schema in flight finishes
std::stop_source g_stop;

void signal_handler(int signal) {
    utils::log::warn(std::format("Received signal {}, finishing in-flight schemas...", signal));
    g_stop.request_stop();
}

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> argv_list(argv + 1, argv + argc);
        if (argv_list.empty() || argv_list[0] == "--help" || argv_list[0] == "-h" ||
            argv_list[0] == "help") {
            print_usage(std::cout);
            return argv_list.empty() ? kExitUsage : kExitOk;
        }

        const auto cl = parse_command_line(argv_list);
        if (cl.is_error()) {
            std::cerr << "error: " << cl.error_message() << "\n\n";
            print_usage(std::cerr);
            return kExitUsage;
        }
        const auto& cmd = cl.value();
        if (!is_known_command(cmd.command)) {
            std::cerr << std::format("error: unknown command '{}'\n\n", cmd.command);
            print_usage(std::cerr);
            return kExitUsage;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // [1/3] Configuration
        auto loaded = ConfigLoader::load_from_file(cmd.config_path);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitUsage;
        }
        if (const auto level = utils::log::parse_level(loaded.config.logging.level)) {
            utils::log::set_level(*level);
        }
        utils::log::debug(std::format("[1/3] Loaded configuration from {}", cmd.config_path));

        // [2/3] Runtime: classification, migration graphs, pool, registry
        auto runtime = Runtime::build(loaded.config, std::make_shared<PgConnectionFactory>());
        if (runtime.is_error()) {
            utils::log::error(std::format("{}: {}", error_code_name(runtime.error_code()),
                                          runtime.error_message()));
            return runtime.error_code() == ErrorCode::CONFIGURATION_ERROR ||
                   runtime.error_code() == ErrorCode::MIGRATION_CONFLICT
                ? kExitUsage : kExitFailure;
        }
        utils::log::debug("[2/3] Runtime initialized");

        // [3/3] Command
        AdminCommands commands(*runtime.value(), std::cout, std::cerr);
        return commands.run(cmd.command, cmd.args, g_stop.get_token());

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailure;
    }
}
