#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace prmerge {

namespace {

constexpr const char *kFunctionPrefix = "function:";
constexpr const char *kTemplatePrefix = "template:";

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool starts_with(const std::string &value, const char *prefix) {
  return value.rfind(prefix, 0) == 0;
}

/**
 * Interpret an untagged YAML scalar as a JSON boolean or number.
 *
 * @param s Scalar text.
 * @return Typed value, or the text itself when it is not a bool or number.
 */
nlohmann::json plain_scalar_to_json(const std::string &s) {
  if (s == "true" || s == "True" || s == "TRUE")
    return true;
  if (s == "false" || s == "False" || s == "FALSE")
    return false;
  if (s == "~" || s == "null" || s == "Null" || s == "NULL")
    return nullptr;
  if (s.empty() || !(std::isdigit(static_cast<unsigned char>(s.front())) ||
                     s.front() == '-' || s.front() == '+')) {
    return s;
  }
  try {
    size_t idx = 0;
    long long i = std::stoll(s, &idx, 10);
    if (idx == s.size())
      return i;
  } catch (const std::out_of_range &) {
    // Too large for an integer; fall through to floating point.
  } catch (const std::invalid_argument &) {
    return s;
  }
  try {
    size_t idx = 0;
    double d = std::stod(s, &idx);
    if (idx == s.size())
      return d;
  } catch (const std::exception &) {
    return s;
  }
  return s;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Quoted scalars stay strings so labels such as `"10"` are not turned into
 * numbers; plain scalars become booleans, null, or numbers where possible.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar:
    if (node.Tag() == "!") {
      return node.Scalar();
    }
    return plain_scalar_to_json(node.Scalar());
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * Merge configurations only hold tables, arrays, strings and booleans, so
 * dates and times are rejected instead of being stringified.
 *
 * @throws std::runtime_error On date, time or date-time values.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  switch (node.type()) {
  case toml::node_type::table: {
    json obj = json::object();
    for (const auto &[key, value] : *node.as_table()) {
      obj[std::string(key.str())] = toml_to_json(value);
    }
    return obj;
  }
  case toml::node_type::array: {
    json arr = json::array();
    for (const auto &item : *node.as_array()) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  case toml::node_type::string:
    return node.as_string()->get();
  case toml::node_type::boolean:
    return node.as_boolean()->get();
  case toml::node_type::integer:
    return node.as_integer()->get();
  case toml::node_type::floating_point:
    return node.as_floating_point()->get();
  default:
    throw std::runtime_error(
        "TOML dates and times are not valid configuration values");
  }
}

std::optional<std::vector<std::string>>
string_list(const nlohmann::json &value) {
  if (!value.is_array()) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto &item : value) {
    if (!item.is_string()) {
      return std::nullopt;
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

enum class ConfigFormat { Yaml, Json, Toml };

/// Pick the document format from the extension of @p path.
ConfigFormat config_format_for(const std::string &path) {
  const std::string ext =
      to_lower_copy(std::filesystem::path(path).extension().string());
  if (ext.empty()) {
    throw std::runtime_error("Unknown config file extension");
  }
  if (ext == ".yaml" || ext == ".yml") {
    return ConfigFormat::Yaml;
  }
  if (ext == ".json") {
    return ConfigFormat::Json;
  }
  if (ext == ".toml" || ext == ".tml") {
    return ConfigFormat::Toml;
  }
  throw std::runtime_error("Unsupported config format: " + ext.substr(1));
}

nlohmann::json branch_spec_to_json(const BranchSpec &spec) {
  if (spec.kind() == BranchSpec::Kind::Fixed) {
    return spec.branches();
  }
  const std::string &description = spec.description();
  if (starts_with(description, kTemplatePrefix)) {
    return {{"template", spec.templates()}};
  }
  if (starts_with(description, kFunctionPrefix)) {
    return {{"function",
             description.substr(std::string(kFunctionPrefix).size())}};
  }
  return {{"derived", description}};
}

} // namespace

BranchSpec branch_spec_from_json(const nlohmann::json &value,
                                 const BranchFunctionRegistry &functions) {
  if (value.is_array()) {
    if (auto branches = string_list(value)) {
      return BranchSpec::fixed(std::move(*branches));
    }
  } else if (value.is_object() && value.size() == 1) {
    auto templ = value.find("template");
    if (templ != value.end()) {
      if (auto templates = string_list(*templ)) {
        return BranchSpec::from_template(std::move(*templates));
      }
    }
    auto function = value.find("function");
    if (function != value.end() && function->is_string()) {
      const auto name = function->get<std::string>();
      auto it = functions.find(name);
      if (it == functions.end() || !it->second) {
        throw std::invalid_argument("refers to unknown branch function `" +
                                    name + "`.");
      }
      return BranchSpec::derived(it->second, kFunctionPrefix + name);
    }
  }
  throw std::invalid_argument(
      "needs `branches` as a list, a `template` or a `function`.");
}

void Config::resolve_project_root(const std::filesystem::path &base_dir) {
  if (project_root_resolved_) {
    throw std::logic_error("Project root has already been resolved");
  }
  namespace fs = std::filesystem;
  fs::path resolved = fs::absolute(base_dir / fs::path(project_root_))
                          .lexically_normal();
  if (!resolved.has_filename() && resolved != resolved.root_path()) {
    resolved = resolved.parent_path();
  }
  project_root_ = resolved.string();
  project_root_resolved_ = true;
}

std::optional<std::string>
Config::required_base_commit(const std::string &branch) const {
  auto it = required_base_commits_.find(branch);
  if (it == required_base_commits_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Config Config::from_json(const nlohmann::json &raw,
                         const BranchFunctionRegistry &functions) {
  Config cfg;
  cfg.set_project_root(raw.at("projectRoot").get<std::string>());

  const auto &repo = raw.at("repository");
  RepositoryConfig repository;
  repository.user = repo.at("user").get<std::string>();
  repository.name = repo.at("name").get<std::string>();
  if (repo.contains("useSsh")) {
    repository.use_ssh = repo["useSsh"].get<bool>();
  }
  cfg.set_repository(std::move(repository));

  std::vector<TargetLabel> labels;
  for (const auto &entry : raw.at("labels")) {
    labels.push_back(
        TargetLabel{LabelPattern::parse(entry.at("pattern").get<std::string>()),
                    branch_spec_from_json(entry.at("branches"), functions)});
  }
  cfg.set_labels(std::move(labels));

  auto commits = raw.find("requiredBaseCommits");
  if (commits != raw.end() && !commits->is_null()) {
    cfg.set_required_base_commits(
        commits->get<std::unordered_map<std::string, std::string>>());
  }

  cfg.set_cla_signed_label(
      LabelPattern::parse(raw.at("claSignedLabel").get<std::string>()));
  cfg.set_merge_ready_label(
      LabelPattern::parse(raw.at("mergeReadyLabel").get<std::string>()));
  auto fixup = raw.find("commitMessageFixupLabel");
  if (fixup != raw.end() && fixup->is_string() &&
      !fixup->get_ref<const std::string &>().empty()) {
    cfg.set_commit_message_fixup_label(
        LabelPattern::parse(fixup->get<std::string>()));
  }

  const auto &strategy = raw.at("githubApiMerge");
  if (strategy.is_object()) {
    cfg.set_github_api_merge(strategy);
  } else if (strategy.is_boolean() && !strategy.get<bool>()) {
    cfg.set_github_api_merge(std::nullopt);
  } else {
    throw std::invalid_argument(
        "`githubApiMerge` needs to be `false` or a merge strategy object.");
  }
  return cfg;
}

nlohmann::json Config::to_json() const {
  nlohmann::json j;
  j["projectRoot"] = project_root_;
  j["repository"] = {{"user", repository_.user},
                     {"name", repository_.name},
                     {"useSsh", repository_.use_ssh}};
  nlohmann::json labels = nlohmann::json::array();
  for (const auto &label : labels_) {
    labels.push_back({{"pattern", label.pattern.to_string()},
                      {"branches", branch_spec_to_json(label.branches)}});
  }
  j["labels"] = std::move(labels);
  if (!required_base_commits_.empty()) {
    j["requiredBaseCommits"] = required_base_commits_;
  }
  j["claSignedLabel"] = cla_signed_label_.to_string();
  j["mergeReadyLabel"] = merge_ready_label_.to_string();
  if (commit_message_fixup_label_) {
    j["commitMessageFixupLabel"] = commit_message_fixup_label_->to_string();
  }
  j["githubApiMerge"] =
      github_api_merge_ ? *github_api_merge_ : nlohmann::json(false);
  return j;
}

/**
 * Load a configuration document from disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 */
nlohmann::json load_config_document(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  try {
    nlohmann::json doc;
    switch (config_format_for(path)) {
    case ConfigFormat::Yaml:
      doc = yaml_to_json(YAML::LoadFile(path));
      break;
    case ConfigFormat::Json: {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> doc;
      break;
    }
    case ConfigFormat::Toml:
      doc = toml_to_json(toml::parse_file(path));
      break;
    }
    config_log()->debug("Config document loaded from {}", path);
    return doc;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
}

} // namespace prmerge
