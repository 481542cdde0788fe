#include "app.hpp"
#include "config_validator.hpp"
#include "log.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace prmerge {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

int code(ExitCode exit_code) { return static_cast<int>(exit_code); }

/// Parse a level name; unknown names yield std::nullopt instead of `off`.
std::optional<spdlog::level::level_enum>
parse_level(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

std::string join(const std::vector<std::string> &values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += values[i];
  }
  return out;
}

std::string describe_branches(const BranchSpec &spec) {
  if (spec.kind() == BranchSpec::Kind::Fixed) {
    return "[" + join(spec.branches()) + "]";
  }
  return spec.description();
}

const char *yes_no(bool value) { return value ? "yes" : "no"; }
} // namespace

/**
 * Execute the main application flow.
 *
 * Parses the command line, initialises logging, loads the configuration and,
 * when labels were supplied, resolves them into destination branches.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Process exit code.
 */
int App::run(int argc, char **argv) {
  config_.reset();
  resolution_.reset();
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  setup_logging();

  ConfigLoadResult result =
      read_and_validate_config(options_.config_file, functions_);
  if (!result.ok()) {
    for (const auto &error : result.errors) {
      err_ << error << '\n';
    }
    if (options_.json_output) {
      out_ << nlohmann::json{{"errors", result.errors}}.dump(2) << '\n';
    }
    return code(ExitCode::kInvalidConfig);
  }
  config_ = std::move(result.config);
  app_log()->debug("Repository {} with {} target label(s)",
                   config_->repository().slug(), config_->labels().size());

  if (options_.labels.empty()) {
    print_summary(*config_);
    return code(ExitCode::kSuccess);
  }
  return resolve_and_report(*config_);
}

void App::setup_logging() const {
  std::string level_str = options_.verbose ? "debug" : "info";
  if (options_.log_level != "info") {
    level_str = options_.log_level;
  }
  auto level = parse_level(level_str);
  init_logger(level.value_or(spdlog::level::info), "", options_.log_file,
              static_cast<std::size_t>(options_.log_rotate));
  if (!level) {
    app_log()->warn("Ignoring invalid log level '{}'", level_str);
  }
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : options_.log_categories) {
    if (auto parsed = parse_level(category_level)) {
      category_levels[category] = *parsed;
    } else {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
    }
  }
  configure_log_categories(category_levels);
}

void App::print_summary(const Config &config) const {
  if (options_.json_output) {
    out_ << config.to_json().dump(2) << '\n';
    return;
  }
  out_ << "repository: " << config.repository().slug()
       << (config.repository().use_ssh ? " (ssh)" : "") << '\n';
  out_ << "project root: " << config.project_root() << '\n';
  out_ << "merge strategy: "
       << (config.github_api_merge_enabled() ? "github api" : "local") << '\n';
  out_ << "target labels:\n";
  for (const auto &label : config.labels()) {
    out_ << "  " << label.pattern.to_string() << " -> "
         << describe_branches(label.branches) << '\n';
  }
}

int App::resolve_and_report(const Config &config) {
  const LabelCategories categories = classify_labels(config, options_.labels);
  nlohmann::json report;
  report["categories"] = {
      {"claSigned", categories.cla_signed},
      {"mergeReady", categories.merge_ready},
      {"commitMessageFixup", categories.commit_message_fixup}};

  auto fail = [&](ExitCode exit_code, const std::string &message) {
    app_log()->error("{}", message);
    if (options_.json_output) {
      report["error"] = message;
      out_ << report.dump(2) << '\n';
    }
    return code(exit_code);
  };

  try {
    resolution_ = resolve_target_branches(config, options_.labels,
                                          options_.target_branch);
  } catch (const NoMatchingTargetLabelError &e) {
    return fail(ExitCode::kNoMatchingLabel, e.what());
  } catch (const BranchResolutionError &e) {
    return fail(ExitCode::kResolutionFailed, e.what());
  }

  const TargetLabel &selected = config.labels()[resolution_->label_index];
  std::vector<std::string> shadowed;
  for (std::size_t index : resolution_->shadowed) {
    shadowed.push_back(config.labels()[index].pattern.to_string());
    app_log()->warn("Target label '{}' also matches but '{}' takes precedence",
                    shadowed.back(), selected.pattern.to_string());
  }

  report["targetLabel"] = selected.pattern.to_string();
  report["matchedLabel"] = resolution_->matched_label;
  report["branches"] = resolution_->branches;
  report["shadowed"] = shadowed;
  nlohmann::json base_commits = nlohmann::json::object();
  for (const auto &branch : resolution_->branches) {
    if (auto sha = config.required_base_commit(branch)) {
      base_commits[branch] = *sha;
    }
  }
  report["requiredBaseCommits"] = base_commits;

  if (resolution_->branches.empty()) {
    return fail(ExitCode::kNoDestination,
                "Target label '" + selected.pattern.to_string() +
                    "' resolved to no branches");
  }

  if (options_.json_output) {
    out_ << report.dump(2) << '\n';
  } else {
    out_ << "cla signed: " << yes_no(categories.cla_signed) << '\n';
    out_ << "merge ready: " << yes_no(categories.merge_ready) << '\n';
    out_ << "commit message fixup: "
         << yes_no(categories.commit_message_fixup) << '\n';
    out_ << "target label: " << selected.pattern.to_string() << " (matched \""
         << resolution_->matched_label << "\")\n";
    out_ << "branches:\n";
    for (const auto &branch : resolution_->branches) {
      out_ << "  " << branch;
      if (auto sha = config.required_base_commit(branch)) {
        out_ << " (requires base commit " << *sha << ")";
      }
      out_ << '\n';
    }
  }
  app_log()->info("Resolved {} branch(es) for label '{}'",
                  resolution_->branches.size(), resolution_->matched_label);
  return code(ExitCode::kSuccess);
}

} // namespace prmerge
