#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace prmerge {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string exit_code_help_text() {
  std::ostringstream oss;
  oss << "Exit codes: 0 success, 1 invalid configuration, 2 no target label "
         "matched, 3 branch resolution failed, 4 no destination branches.\n";
  oss << "Logging categories: app, cli, config, logging. Use --log-category "
         "NAME=LEVEL to override.";
  return oss.str();
}
} // namespace

/**
 * Parse command line arguments into the internal option structure.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"prmerge: resolve pull request target labels into branches"};
  app.footer(exit_code_help_text());
  CliOptions options;

  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "prmerge " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to the merge configuration (YAML, JSON, or TOML)")
      ->type_name("FILE")
      ->required()
      ->group("General");
  app.add_flag("--json", options.json_output,
               "Print the resolution outcome as JSON")
      ->group("General");

  app.add_option("-l,--label", options.labels,
                 "Label attached to the pull request (repeatable)")
      ->type_name("NAME")
      ->group("Pull Request");
  app.add_option("-t,--target-branch", options.target_branch,
                 "Branch selected as base in the GitHub UI")
      ->type_name("BRANCH")
      ->group("Pull Request");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->default_val("info")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  std::vector<std::string> log_category_args;
  app.add_option("--log-category", log_category_args,
                 "Set the level of a logging category (NAME or NAME=LEVEL)")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  try {
    app.parse(argc, argv);
    for (const auto &value : log_category_args) {
      auto pos = value.find('=');
      std::string name = pos == std::string::npos ? value : value.substr(0, pos);
      std::string level = pos == std::string::npos ? std::string{"debug"}
                                                   : value.substr(pos + 1);
      if (name.empty()) {
        throw CLI::ValidationError("--log-category",
                                   "category name must not be empty");
      }
      if (level.empty()) {
        level = "debug";
      }
      options.log_categories[name] = level;
    }
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  if (!options.labels.empty() && options.target_branch.empty()) {
    cli_log()->warn("No --target-branch given; derived branch lists receive "
                    "an empty target branch");
  }
  return options;
}

} // namespace prmerge
