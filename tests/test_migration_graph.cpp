#include <catch2/catch_test_macros.hpp>
#include "migration/migration.hpp"

#include <set>
#include <string>
#include <vector>

using namespace pgtenant;

namespace {

Migration make(std::string id, std::vector<std::string> deps = {}) {
    Migration m;
    m.id = std::move(id);
    m.dependencies = std::move(deps);
    return m;
}

using Ids = std::vector<std::string>;

} // namespace

TEST_CASE("MigrationGraph: dependency order with id tie-break", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    REQUIRE(graph.add(make("0003_c", {"0001_a"})).is_ok());
    REQUIRE(graph.add(make("0002_b", {"0001_a"})).is_ok());
    REQUIRE(graph.add(make("0001_a")).is_ok());
    REQUIRE(graph.add(make("0004_d", {"0002_b", "0003_c"})).is_ok());

    auto order = graph.ordered_ids();
    REQUIRE(order.is_ok());
    CHECK(order.value() == Ids{"0001_a", "0002_b", "0003_c", "0004_d"});
    CHECK(graph.size() == 4);
    CHECK(graph.category() == MigrationCategory::TENANT);
}

TEST_CASE("MigrationGraph: dependencies outrank id order", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::SHARED);
    REQUIRE(graph.add(make("0001_late", {"0009_first"})).is_ok());
    REQUIRE(graph.add(make("0009_first")).is_ok());

    CHECK(graph.ordered_ids().value() == Ids{"0009_first", "0001_late"});
}

TEST_CASE("MigrationGraph: duplicate and empty ids", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    REQUIRE(graph.add(make("0001_init")).is_ok());
    CHECK(graph.add(make("0001_init")).error_code() == ErrorCode::MIGRATION_CONFLICT);
    CHECK(graph.add(make("")).error_code() == ErrorCode::MIGRATION_CONFLICT);
    CHECK(graph.size() == 1);
}

TEST_CASE("MigrationGraph: cycles are conflicts", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    REQUIRE(graph.add(make("0001_a", {"0003_c"})).is_ok());
    REQUIRE(graph.add(make("0002_b", {"0001_a"})).is_ok());
    REQUIRE(graph.add(make("0003_c", {"0002_b"})).is_ok());
    REQUIRE(graph.add(make("0004_free")).is_ok());

    auto order = graph.ordered_ids();
    REQUIRE(order.is_error());
    CHECK(order.error_code() == ErrorCode::MIGRATION_CONFLICT);
    CHECK(order.error_message().find("0002_b") != std::string::npos);
    CHECK(order.error_message().find("0004_free") == std::string::npos);

    CHECK(graph.plan({}).error_code() == ErrorCode::MIGRATION_CONFLICT);
}

TEST_CASE("MigrationGraph: self dependency is a conflict", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    REQUIRE(graph.add(make("0001_a", {"0001_a"})).is_ok());
    CHECK(graph.ordered_ids().error_code() == ErrorCode::MIGRATION_CONFLICT);
}

TEST_CASE("MigrationGraph: unknown dependency", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    REQUIRE(graph.add(make("0002_b", {"0001_gone"})).is_ok());

    auto order = graph.ordered_ids();
    REQUIRE(order.is_error());
    CHECK(order.error_message().find("0001_gone") != std::string::npos);

    // Acceptable once the ledger already has it (squashed history)
    auto plan = graph.plan({"0001_gone"});
    REQUIRE(plan.is_ok());
    CHECK(plan.value() == Ids{"0002_b"});
}

TEST_CASE("MigrationGraph: plan skips applied migrations", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    REQUIRE(graph.add(make("0001_a")).is_ok());
    REQUIRE(graph.add(make("0002_b", {"0001_a"})).is_ok());
    REQUIRE(graph.add(make("0003_c", {"0002_b"})).is_ok());

    CHECK(graph.plan({}).value() == Ids{"0001_a", "0002_b", "0003_c"});
    CHECK(graph.plan({"0001_a"}).value() == Ids{"0002_b", "0003_c"});
    CHECK(graph.plan({"0001_a", "0002_b", "0003_c"}).value().empty());

    // Ledger rows for migrations no longer in the graph are ignored
    CHECK(graph.plan({"0001_a", "0000_legacy"}).value() == Ids{"0002_b", "0003_c"});
}

TEST_CASE("MigrationGraph: inconsistent history is a conflict", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    REQUIRE(graph.add(make("0001_a")).is_ok());
    REQUIRE(graph.add(make("0002_b", {"0001_a"})).is_ok());

    auto plan = graph.plan({"0002_b"});
    REQUIRE(plan.is_error());
    CHECK(plan.error_code() == ErrorCode::MIGRATION_CONFLICT);
    CHECK(plan.error_message().find("inconsistent") != std::string::npos);
}

TEST_CASE("MigrationGraph: leaf nodes", "[migration][graph]") {
    MigrationGraph graph(MigrationCategory::TENANT);
    CHECK(graph.leaf_nodes().empty());

    REQUIRE(graph.add(make("0001_a")).is_ok());
    REQUIRE(graph.add(make("0002_b", {"0001_a"})).is_ok());
    REQUIRE(graph.add(make("0003_c", {"0001_a"})).is_ok());

    CHECK(graph.leaf_nodes() == Ids{"0002_b", "0003_c"});
    REQUIRE(graph.find("0002_b") != nullptr);
    CHECK(graph.find("0002_b")->dependencies == Ids{"0001_a"});
    CHECK(graph.find("0009_x") == nullptr);
}
