#include "migration/migration_loader.hpp"
#include "core/utils.hpp"
#include "tenant/schema_name.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace pgtenant {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDependsPrefix = "-- depends:";
constexpr size_t kNumberWidth = 4;

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

unsigned number_of(const std::string& id) {
    return static_cast<unsigned>(std::stoul(id.substr(0, kNumberWidth)));
}

} // anonymous namespace

bool MigrationLoader::is_migration_file(const std::string& filename) {
    if (filename.size() <= kNumberWidth + 1 + 4 || !filename.ends_with(".sql")) {
        return false;
    }
    for (size_t i = 0; i < kNumberWidth; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(filename[i]))) return false;
    }
    if (filename[kNumberWidth] != '_') return false;
    const auto stem = filename.substr(0, filename.size() - 4);
    return is_safe_identifier(stem);
}

Migration MigrationLoader::parse(const std::string& id,
                                 const std::string& contents,
                                 const std::optional<std::string>& previous) {
    Migration migration;
    migration.id = id;
    migration.sql = contents;

    bool declared = false;
    std::istringstream lines(contents);
    std::string line;
    while (std::getline(lines, line)) {
        const auto trimmed = utils::trim(line);
        if (trimmed.empty()) continue;
        if (!trimmed.starts_with("--")) break;      // header ends at first statement
        if (!trimmed.starts_with(kDependsPrefix)) continue;

        declared = true;
        for (const auto& dep : utils::split(trimmed.substr(kDependsPrefix.size()), ',')) {
            auto name = utils::trim(dep);
            if (!name.empty()) migration.dependencies.push_back(std::move(name));
        }
    }

    if (!declared && previous) {
        migration.dependencies.push_back(*previous);
    }
    return migration;
}

Result<MigrationGraph> MigrationLoader::load_directory(const std::string& dir,
                                                       MigrationCategory category) {
    MigrationGraph graph(category);

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        utils::log::debug(std::format("{} migration directory '{}' does not exist",
                                      migration_category_name(category), dir));
        return Result<MigrationGraph>::ok(std::move(graph));
    }
    if (!fs::is_directory(dir, ec)) {
        return Result<MigrationGraph>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("migration path '{}' is not a directory", dir));
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        auto name = entry.path().filename().string();
        if (is_migration_file(name)) files.push_back(std::move(name));
    }
    if (ec) {
        return Result<MigrationGraph>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("cannot list migration directory '{}': {}", dir, ec.message()));
    }
    std::sort(files.begin(), files.end());

    std::optional<std::string> previous;
    for (const auto& file : files) {
        std::string contents;
        if (!read_file(fs::path(dir) / file, contents)) {
            return Result<MigrationGraph>::error(ErrorCode::CONFIGURATION_ERROR,
                std::format("cannot read migration file '{}'", (fs::path(dir) / file).string()));
        }
        const auto id = file.substr(0, file.size() - 4);
        auto added = graph.add(parse(id, contents, previous));
        if (added.is_error()) {
            return Result<MigrationGraph>::from_error(added);
        }
        previous = id;
    }

    utils::log::debug(std::format("loaded {} {} migrations from '{}'",
                                  graph.size(), migration_category_name(category), dir));
    return Result<MigrationGraph>::ok(std::move(graph));
}

Result<std::string> generate_migration(const std::string& dir,
                                       const MigrationGraph& graph,
                                       const std::string& name) {
    std::string label = name;
    if (label.empty()) {
        // 2026-10-19T08:15:00.000Z -> auto_20261019_0815
        const auto ts = utils::format_timestamp(utils::now());
        label = std::format("auto_{}{}{}_{}{}",
            ts.substr(0, 4), ts.substr(5, 2), ts.substr(8, 2), ts.substr(11, 2), ts.substr(14, 2));
    }
    if (!is_safe_identifier(label) || label.size() > kMaxSchemaNameLength - kNumberWidth - 1) {
        return Result<std::string>::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("migration name '{}' may only contain [a-z0-9_]", label));
    }

    unsigned next = 1;
    for (const auto& id : graph.ids()) {
        if (id.size() > kNumberWidth && std::all_of(id.begin(), id.begin() + kNumberWidth,
                [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            next = std::max(next, number_of(id) + 1);
        }
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<std::string>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("cannot create migration directory '{}': {}", dir, ec.message()));
    }

    const auto id = std::format("{:04d}_{}", next, label);
    const auto path = (fs::path(dir) / (id + ".sql")).string();
    if (fs::exists(path, ec)) {
        return Result<std::string>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("migration file '{}' already exists", path));
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Result<std::string>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("cannot write migration file '{}'", path));
    }
    out << kDependsPrefix;
    const auto leaves = graph.leaf_nodes();
    if (!leaves.empty()) {
        out << ' ' << utils::join(leaves, ", ");
    }
    out << "\n-- " << migration_category_name(graph.category())
        << " migration " << id << "\n\n";
    out.close();
    if (!out) {
        return Result<std::string>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("failed writing migration file '{}'", path));
    }

    utils::log::info(std::format("created {} migration {}", migration_category_name(graph.category()), path));
    return Result<std::string>::ok(path);
}

} // namespace pgtenant
