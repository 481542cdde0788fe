/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for prmerge.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef PRMERGE_CLI_HPP
#define PRMERGE_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace prmerge {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code requested by the parser.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 */
struct CliOptions {
  bool verbose = false;            ///< Enables verbose output
  std::string config_file;         ///< Merge configuration file
  std::vector<std::string> labels; ///< Labels attached to the pull request
  std::string target_branch;       ///< Base branch chosen in the GitHub UI
  bool json_output{false};         ///< Print the outcome as JSON
  std::string log_level = "info";  ///< Logging verbosity level
  std::string log_file;            ///< Optional path to rotating log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
};

/**
 * Parse command line arguments into CliOptions.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 * @throws CliParseExit When help or version output was requested or the
 *         arguments are invalid.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace prmerge

#endif // PRMERGE_CLI_HPP
