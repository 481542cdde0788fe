#include "config.hpp"
#include "target_label.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("fixed branch specs ignore the target branch", "[target_label]") {
  auto spec = prmerge::BranchSpec::fixed({"main", "v1"});
  REQUIRE(spec.kind() == prmerge::BranchSpec::Kind::Fixed);
  REQUIRE(spec.resolve("anything") ==
          std::vector<std::string>{"main", "v1"});
  REQUIRE(spec.resolve("") == std::vector<std::string>{"main", "v1"});

  auto empty = prmerge::BranchSpec::fixed({});
  REQUIRE(empty.resolve("main").empty());
}

TEST_CASE("derived branch specs call their function", "[target_label]") {
  std::string seen;
  auto spec = prmerge::BranchSpec::derived(
      [&seen](const std::string &target) {
        seen = target;
        return std::vector<std::string>{target, "main"};
      },
      "function:with_main");
  REQUIRE(spec.kind() == prmerge::BranchSpec::Kind::Derived);
  REQUIRE(spec.description() == "function:with_main");
  REQUIRE(spec.branches().empty());
  REQUIRE(spec.resolve("10.0.x") ==
          std::vector<std::string>{"10.0.x", "main"});
  REQUIRE(seen == "10.0.x");

  REQUIRE_THROWS_AS(prmerge::BranchSpec::derived(prmerge::BranchFunction{}),
                    std::invalid_argument);
}

TEST_CASE("template branch specs substitute the target", "[target_label]") {
  auto spec = prmerge::BranchSpec::from_template({"{target}", "{target}-lts"});
  REQUIRE(spec.kind() == prmerge::BranchSpec::Kind::Derived);
  REQUIRE(spec.description() == "template:[{target}, {target}-lts]");
  REQUIRE(spec.templates() ==
          std::vector<std::string>{"{target}", "{target}-lts"});
  REQUIRE(spec.resolve("10.0.x") ==
          std::vector<std::string>{"10.0.x", "10.0.x-lts"});
  REQUIRE(spec.resolve("") == std::vector<std::string>{"", "-lts"});

  auto literal = prmerge::BranchSpec::from_template({"main", "{target}"});
  REQUIRE(literal.resolve("v2") == std::vector<std::string>{"main", "v2"});
}

TEST_CASE("branch specs from raw values", "[target_label]") {
  prmerge::BranchFunctionRegistry functions;
  functions["patch_line"] = [](const std::string &target) {
    return std::vector<std::string>{target, "main"};
  };

  auto fixed = prmerge::branch_spec_from_json(
      nlohmann::json::array({"main", "v1"}), functions);
  REQUIRE(fixed.kind() == prmerge::BranchSpec::Kind::Fixed);
  REQUIRE(fixed.branches() == std::vector<std::string>{"main", "v1"});

  auto templ = prmerge::branch_spec_from_json(
      nlohmann::json{{"template", nlohmann::json::array({"{target}"})}}, functions);
  REQUIRE(templ.resolve("9.x") == std::vector<std::string>{"9.x"});

  auto function = prmerge::branch_spec_from_json(
      nlohmann::json{{"function", "patch_line"}}, functions);
  REQUIRE(function.description() == "function:patch_line");
  REQUIRE(function.resolve("9.x") == std::vector<std::string>{"9.x", "main"});

  REQUIRE_THROWS_AS(prmerge::branch_spec_from_json(
                        nlohmann::json{{"function", "missing"}}, functions),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(prmerge::branch_spec_from_json("main", functions),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(prmerge::branch_spec_from_json(
                        nlohmann::json::array({"main", 1}), functions),
                    std::invalid_argument);
}
