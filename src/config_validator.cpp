/**
 * @file config_validator.cpp
 * @brief Implements structural validation and loading of merge configurations.
 */
#include "config_validator.hpp"
#include "log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <memory>
#include <regex>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace prmerge {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

/// Look up @p key; nullptr when @p raw is not an object or lacks the key.
const nlohmann::json *field(const nlohmann::json &raw, const char *key) {
  if (!raw.is_object()) {
    return nullptr;
  }
  auto it = raw.find(key);
  return it == raw.end() ? nullptr : &*it;
}

/**
 * Whether a value counts as set: present, not null, not false, not zero and
 * not an empty string. Arrays and objects are always set.
 */
bool is_set(const nlohmann::json *value) {
  if (value == nullptr) {
    return false;
  }
  switch (value->type()) {
  case nlohmann::json::value_t::null:
  case nlohmann::json::value_t::discarded:
    return false;
  case nlohmann::json::value_t::boolean:
    return value->get<bool>();
  case nlohmann::json::value_t::string:
    return !value->get_ref<const std::string &>().empty();
  case nlohmann::json::value_t::number_integer:
  case nlohmann::json::value_t::number_unsigned:
    return value->get<long long>() != 0;
  case nlohmann::json::value_t::number_float: {
    double d = value->get<double>();
    return d != 0.0 && !std::isnan(d);
  }
  default:
    return true;
  }
}

bool is_non_empty_string(const nlohmann::json *value) {
  return value != nullptr && value->is_string() &&
         !value->get_ref<const std::string &>().empty();
}

/// Check that a pattern compiles; returns an error message when it does not.
std::optional<std::string> check_pattern(const std::string &text,
                                         const std::string &where) {
  try {
    (void)LabelPattern::parse(text);
  } catch (const std::regex_error &e) {
    return "Invalid regular expression for `" + where + "`: " + e.what();
  }
  return std::nullopt;
}

void check_category_label(const nlohmann::json &raw, const char *key,
                          const char *missing_message,
                          std::vector<std::string> &errors) {
  const auto *value = field(raw, key);
  if (!is_set(value)) {
    errors.emplace_back(missing_message);
    return;
  }
  if (!value->is_string()) {
    errors.push_back(std::string("`") + key +
                     "` needs to be a string pattern.");
    return;
  }
  if (auto error = check_pattern(value->get<std::string>(), key)) {
    errors.push_back(std::move(*error));
  }
}

void check_target_labels(const nlohmann::json &labels,
                         const BranchFunctionRegistry &functions,
                         std::vector<std::string> &errors) {
  if (labels.empty()) {
    errors.emplace_back("Label configuration needs at least one target label.");
    return;
  }
  for (std::size_t i = 0; i < labels.size(); ++i) {
    const auto &entry = labels[i];
    const std::string prefix = "Target label #" + std::to_string(i + 1) + " ";
    if (!entry.is_object()) {
      errors.push_back(prefix + "needs to be an object.");
      continue;
    }
    const auto *pattern = field(entry, "pattern");
    if (!is_non_empty_string(pattern)) {
      errors.push_back(prefix + "needs a `pattern`.");
    } else if (auto error = check_pattern(
                   pattern->get<std::string>(),
                   "labels[" + std::to_string(i) + "].pattern")) {
      errors.push_back(std::move(*error));
    }
    const auto *branches = field(entry, "branches");
    if (branches == nullptr) {
      errors.push_back(prefix +
                       "needs `branches` as a list, a `template` or a "
                       "`function`.");
      continue;
    }
    try {
      (void)branch_spec_from_json(*branches, functions);
    } catch (const std::invalid_argument &e) {
      errors.push_back(prefix + e.what());
    }
  }
}

void check_required_base_commits(const nlohmann::json &raw,
                                 std::vector<std::string> &errors) {
  const auto *commits = field(raw, "requiredBaseCommits");
  if (commits == nullptr || commits->is_null()) {
    return;
  }
  bool valid = commits->is_object() &&
               std::all_of(commits->begin(), commits->end(),
                           [](const nlohmann::json &sha) {
                             return is_non_empty_string(&sha);
                           });
  if (!valid) {
    errors.emplace_back(
        "Required base commits need to map branch names to commit SHAs.");
  }
}

std::vector<std::string> distinct(std::vector<std::string> errors) {
  std::unordered_set<std::string> seen;
  std::vector<std::string> out;
  out.reserve(errors.size());
  for (auto &error : errors) {
    if (seen.insert(error).second) {
      out.push_back(std::move(error));
    }
  }
  return out;
}

} // namespace

std::vector<std::string>
validate_config(const nlohmann::json &raw,
                const BranchFunctionRegistry &functions) {
  std::vector<std::string> errors;

  const auto *project_root = field(raw, "projectRoot");
  if (!is_set(project_root)) {
    errors.emplace_back("Missing project root.");
  } else if (!project_root->is_string()) {
    errors.emplace_back("Project root needs to be a string.");
  }

  const auto *labels = field(raw, "labels");
  if (!is_set(labels)) {
    errors.emplace_back("No label configuration.");
  } else if (!labels->is_array()) {
    errors.emplace_back("Label configuration needs to be an array.");
  } else {
    check_target_labels(*labels, functions, errors);
  }

  const auto *repository = field(raw, "repository");
  if (!is_set(repository)) {
    errors.emplace_back("No repository is configured.");
  } else {
    if (!is_non_empty_string(field(*repository, "user")) ||
        !is_non_empty_string(field(*repository, "name"))) {
      errors.emplace_back("Repository configuration needs to specify a `user` "
                          "and repository `name`.");
    }
    const auto *use_ssh = field(*repository, "useSsh");
    if (use_ssh != nullptr && !use_ssh->is_boolean()) {
      errors.emplace_back("Repository `useSsh` needs to be a boolean.");
    }
  }

  check_category_label(raw, "claSignedLabel", "No CLA signed label configured.",
                       errors);
  check_category_label(raw, "mergeReadyLabel",
                       "No merge ready label configured.", errors);

  const auto *strategy = field(raw, "githubApiMerge");
  if (strategy == nullptr || strategy->is_null()) {
    errors.emplace_back(
        "No explicit choice of merge strategy. Please set `githubApiMerge`.");
  } else if (!strategy->is_object() &&
             !(strategy->is_boolean() && !strategy->get<bool>())) {
    errors.emplace_back(
        "`githubApiMerge` needs to be `false` or a merge strategy object.");
  }

  const auto *fixup = field(raw, "commitMessageFixupLabel");
  if (fixup != nullptr && !fixup->is_null()) {
    if (!fixup->is_string()) {
      errors.emplace_back(
          "`commitMessageFixupLabel` needs to be a string pattern.");
    } else if (auto error = check_pattern(fixup->get<std::string>(),
                                          "commitMessageFixupLabel")) {
      errors.push_back(std::move(*error));
    }
  }

  check_required_base_commits(raw, errors);
  return distinct(std::move(errors));
}

ConfigLoadResult validate_and_build(const nlohmann::json &raw,
                                    const std::filesystem::path &base_dir,
                                    const BranchFunctionRegistry &functions) {
  ConfigLoadResult result;
  result.errors = validate_config(raw, functions);
  if (!result.errors.empty()) {
    return result;
  }
  Config cfg = Config::from_json(raw, functions);
  cfg.resolve_project_root(base_dir);
  result.config = std::move(cfg);
  return result;
}

ConfigLoadResult
read_and_validate_config(const std::string &path,
                         const BranchFunctionRegistry &functions) {
  nlohmann::json raw;
  try {
    raw = load_config_document(path);
  } catch (const std::exception &e) {
    ConfigLoadResult failed;
    failed.errors.push_back(std::string(kLoadErrorPrefix) + e.what());
    return failed;
  }
  const auto base_dir = std::filesystem::absolute(path).parent_path();
  ConfigLoadResult result = validate_and_build(raw, base_dir, functions);
  if (result.ok()) {
    config_log()->info("Config loaded successfully from {}", path);
  } else {
    config_log()->warn("{} configuration error(s) in {}", result.errors.size(),
                       path);
  }
  return result;
}

} // namespace prmerge
