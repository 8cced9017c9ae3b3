#include <biodispatch/dispatch/registry.hpp>
#include "fake_executor.hpp"
#include <catch.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace biodispatch;
using biodispatch::testing::FakeExecutor;

TEST_CASE("CommandRegistry::Construction - One dispatcher per entry", "[CommandRegistry]") {
  auto executor = FakeExecutor{};
  auto table = std::vector<CommandSpec>{
    {"view", "view", {}},
    {"import", "samimport", {}},
    {"flagstat", "flagstat", {}},
  };
  auto registry = CommandRegistry{executor, table};

  REQUIRE(registry.size() == 3);
  REQUIRE(registry.names()
          == std::vector<std::string>{"flagstat", "samimport", "view"});
  REQUIRE(registry.contains("samimport"));
  REQUIRE_FALSE(registry.contains("import"));

  SECTION("public name resolves to the internal identifier") {
    executor.outcome = {0, {}, "done"};
    auto result = registry.at("samimport")({"ref.fai", "in.sam", "out.bam"});
    REQUIRE(result.output() == "done");
    REQUIRE(executor.calls.back().first == "import");
    REQUIRE(registry.at("samimport").identifier() == "import");
  }

  SECTION("call shortcut") {
    executor.outcome = {0, {}, "1\n"};
    REQUIRE(registry("view", {"-c", "in.bam"}).output() == "1\n");
    REQUIRE(executor.calls.back().first == "view");
  }

  SECTION("unknown names") {
    REQUIRE(registry.find("pileup") == nullptr);
    REQUIRE_THROWS_AS(registry.at("pileup"), std::out_of_range);
    REQUIRE_THROWS_WITH(registry("pileup", {}),
                        "Command is not registered: pileup");
  }

  SECTION("const lookup") {
    const auto& frozen = registry;
    REQUIRE(frozen.find("view") != nullptr);
    REQUIRE(frozen.at("view").public_name() == "view");
    REQUIRE_THROWS_AS(frozen.at("tview"), std::out_of_range);
  }

  SECTION("dispatchers keep separate diagnostics") {
    executor.outcome = {0, {"[bam_index_load] v"}, "x"};
    registry.at("view")({});
    executor.outcome = {0, {"[bam_index_load] f"}, "x"};
    registry.at("flagstat")({});
    REQUIRE(registry.at("view").messages()
            == std::vector<std::string>{"[bam_index_load] v"});
    REQUIRE(registry.at("flagstat").messages()
            == std::vector<std::string>{"[bam_index_load] f"});
  }
}

TEST_CASE("CommandRegistry::Construction - Rejects duplicated names", "[CommandRegistry]") {
  auto executor = FakeExecutor{};
  auto table = std::vector<CommandSpec>{
    {"view", "view", {}},
    {"cat", "view", {}},
  };
  REQUIRE_THROWS_AS(CommandRegistry(executor, table), std::invalid_argument);
}

TEST_CASE("CommandRegistry::Configuration - Shared by every dispatcher", "[CommandRegistry]") {
  auto executor = FakeExecutor{};
  auto table = std::vector<CommandSpec>{{"view", "view", {}}, {"cat", "cat", {}}};
  auto registry
    = CommandRegistry{executor, table, DispatchConfig{.benign_prefixes = {}}};

  executor.outcome = {0, {"[bam_index_load] x"}, "x"};
  REQUIRE_THROWS_AS(registry.at("view")({}), UnexpectedDiagnostic);
  REQUIRE_THROWS_AS(registry.at("cat")({}), UnexpectedDiagnostic);
}
