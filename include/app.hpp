/**
 * @file app.hpp
 * @brief Command line application orchestrating configuration loading and
 * label resolution.
 */

#ifndef PRMERGE_APP_HPP
#define PRMERGE_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "label_resolver.hpp"
#include "target_label.hpp"

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace prmerge {

/// Process exit codes returned by App::run().
enum class ExitCode : int {
  kSuccess = 0,            ///< Configuration valid and branches resolved.
  kInvalidConfig = 1,      ///< Load or validation errors.
  kNoMatchingLabel = 2,    ///< No target label matched.
  kResolutionFailed = 3,   ///< A derived branch function threw.
  kNoDestination = 4       ///< Resolution produced no branches.
};

/**
 * Main application entry point responsible for CLI parsing, logger setup,
 * configuration loading and reporting the resolution outcome.
 */
class App {
public:
  /**
   * @param out Stream receiving results.
   * @param err Stream receiving configuration errors.
   */
  explicit App(std::ostream &out = std::cout, std::ostream &err = std::cerr)
      : out_(out), err_(err) {}

  /**
   * Make a branch function available to `{"function": name}` entries.
   *
   * Must be called before run().
   */
  void register_branch_function(const std::string &name,
                                BranchFunction function) {
    functions_[name] = std::move(function);
  }

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Process exit code, see ExitCode.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration; empty when loading failed.
  const std::optional<Config> &config() const { return config_; }

  /// Resolution of the last run; empty when nothing was resolved.
  const std::optional<TargetResolution> &resolution() const {
    return resolution_;
  }

private:
  void setup_logging() const;
  void print_summary(const Config &config) const;
  int resolve_and_report(const Config &config);

  std::ostream &out_;
  std::ostream &err_;
  BranchFunctionRegistry functions_;
  CliOptions options_;
  std::optional<Config> config_;
  std::optional<TargetResolution> resolution_;
};

} // namespace prmerge

#endif // PRMERGE_APP_HPP
