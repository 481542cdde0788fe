#include "app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
std::string write_config() {
  std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "prmerge_app";
  std::filesystem::create_directories(dir);
  std::filesystem::path path = dir / "merge.json";
  std::ofstream f(path.string());
  f << R"({
    "projectRoot": ".",
    "repository": {"user": "angular", "name": "angular"},
    "labels": [
      {"pattern": "target: major", "branches": ["main"]},
      {"pattern": "regex:^target: (minor|major)$", "branches": ["main", "v1"]},
      {"pattern": "target: lts", "branches": {"function": "lts_line"}},
      {"pattern": "target: rc", "branches": {"template": ["{target}-rc"]}},
      {"pattern": "target: none", "branches": []}
    ],
    "requiredBaseCommits": {"v1": "abc123"},
    "claSignedLabel": "cla: yes",
    "mergeReadyLabel": "action: merge",
    "githubApiMerge": false
  })";
  return path.string();
}

prmerge::BranchFunction lts_line() {
  return [](const std::string &target) -> std::vector<std::string> {
    if (target.empty()) {
      throw std::invalid_argument("target branch required");
    }
    return {target, target + "-lts"};
  };
}

struct AppRun {
  int code;
  std::string out;
  std::string err;
};

AppRun run_app(std::vector<std::string> args) {
  std::ostringstream out;
  std::ostringstream err;
  prmerge::App app(out, err);
  app.register_branch_function("lts_line", lts_line());
  args.insert(args.begin(), "prmerge");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  int code = app.run(static_cast<int>(argv.size()), argv.data());
  return {code, out.str(), err.str()};
}
} // namespace

TEST_CASE("app prints a configuration summary", "[app]") {
  auto config = write_config();
  auto run = run_app({"--config", config});
  REQUIRE(run.code == 0);
  REQUIRE(run.out.find("repository: angular/angular") != std::string::npos);
  REQUIRE(run.out.find("target: major -> [main]") != std::string::npos);
  REQUIRE(run.out.find("target: lts -> function:lts_line") !=
          std::string::npos);

  auto json_run = run_app({"--config", config, "--json"});
  REQUIRE(json_run.code == 0);
  auto doc = nlohmann::json::parse(json_run.out);
  REQUIRE(doc["labels"][2]["branches"]["function"] == "lts_line");
  REQUIRE(doc["labels"][3]["branches"]["template"][0] == "{target}-rc");
  REQUIRE(doc["githubApiMerge"] == false);
}

TEST_CASE("app resolves target labels", "[app]") {
  auto config = write_config();
  auto run = run_app({"--config", config, "-l", "cla: yes", "-l",
                      "target: minor", "-t", "main"});
  REQUIRE(run.code == 0);
  REQUIRE(run.out.find("cla signed: yes") != std::string::npos);
  REQUIRE(run.out.find("merge ready: no") != std::string::npos);
  REQUIRE(run.out.find("v1 (requires base commit abc123)") !=
          std::string::npos);

  auto json_run = run_app({"--config", config, "--json", "-l", "target: major",
                           "-t", "main"});
  REQUIRE(json_run.code == 0);
  auto doc = nlohmann::json::parse(json_run.out);
  REQUIRE(doc["targetLabel"] == "target: major");
  REQUIRE(doc["matchedLabel"] == "target: major");
  REQUIRE(doc["branches"] == nlohmann::json::array({"main"}));
  REQUIRE(doc["shadowed"] ==
          nlohmann::json::array({"regex:^target: (minor|major)$"}));
  REQUIRE(doc["categories"]["claSigned"] == false);

  auto lts = run_app({"--config", config, "--json", "-l", "target: lts", "-t",
                      "10.0.x"});
  REQUIRE(lts.code == 0);
  REQUIRE(nlohmann::json::parse(lts.out)["branches"] ==
          nlohmann::json::array({"10.0.x", "10.0.x-lts"}));
}

TEST_CASE("app exit codes", "[app]") {
  auto config = write_config();

  auto no_match = run_app({"--config", config, "--json", "-l", "docs"});
  REQUIRE(no_match.code == 2);
  REQUIRE(nlohmann::json::parse(no_match.out).contains("error"));

  auto failed = run_app({"--config", config, "-l", "target: lts"});
  REQUIRE(failed.code == 3);

  auto none = run_app({"--config", config, "-l", "target: none"});
  REQUIRE(none.code == 4);

  auto missing = run_app({"--config", config + ".missing.json"});
  REQUIRE(missing.code == 1);
  REQUIRE(missing.err.find("File could not be loaded. Error: ") == 0);

  auto no_config = run_app({});
  REQUIRE(no_config.code != 0);
}

TEST_CASE("app reports every validation error", "[app]") {
  std::filesystem::path path =
      std::filesystem::temp_directory_path() / "prmerge_app" / "empty.json";
  std::filesystem::create_directories(path.parent_path());
  {
    std::ofstream f(path.string());
    f << "{}";
  }
  auto run = run_app({"--config", path.string(), "--json"});
  REQUIRE(run.code == 1);
  auto doc = nlohmann::json::parse(run.out);
  REQUIRE(doc["errors"].size() == 6);
  REQUIRE(run.err.find("Missing project root.\n") == 0);
}

TEST_CASE("app exposes the last run", "[app]") {
  auto config = write_config();
  std::ostringstream out;
  std::ostringstream err;
  prmerge::App app(out, err);
  app.register_branch_function("lts_line", lts_line());
  std::vector<std::string> args{"prmerge",  "--config", config, "-l",
                                "target: major", "-t",  "main"};
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  REQUIRE(app.run(static_cast<int>(argv.size()), argv.data()) == 0);
  REQUIRE(app.options().labels == std::vector<std::string>{"target: major"});
  REQUIRE(app.options().target_branch == "main");
  REQUIRE(app.config().has_value());
  REQUIRE(app.config()->project_root() ==
          std::filesystem::path(config).parent_path().string());
  REQUIRE(app.resolution().has_value());
  REQUIRE(app.resolution()->label_index == 0);
  REQUIRE(app.resolution()->shadowed == std::vector<std::size_t>{1});

  args[2] = config + ".missing.json";
  argv.clear();
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  REQUIRE(app.run(static_cast<int>(argv.size()), argv.data()) == 1);
  REQUIRE_FALSE(app.config().has_value());
  REQUIRE_FALSE(app.resolution().has_value());
}
