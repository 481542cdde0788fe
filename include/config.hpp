#ifndef PRMERGE_CONFIG_HPP
#define PRMERGE_CONFIG_HPP

#include "label_pattern.hpp"
#include "target_label.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prmerge {

/// Upstream repository the merge tooling pushes to.
struct RepositoryConfig {
  std::string user;     ///< Owner of the repository on GitHub.
  std::string name;     ///< Repository name.
  bool use_ssh{false};  ///< Push over SSH instead of HTTPS.

  /// `user/name` identifier.
  std::string slug() const { return user + "/" + name; }

  bool operator==(const RepositoryConfig &other) const {
    return user == other.user && name == other.name &&
           use_ssh == other.use_ssh;
  }
};

/**
 * Merge configuration for a single repository.
 *
 * Instances are built from a validated raw document (see
 * config_validator.hpp) and shared read-only for the remainder of the run.
 */
class Config {
public:
  /// Project root; absolute once resolve_project_root() ran.
  const std::string &project_root() const { return project_root_; }

  /// Set the project root as written in the configuration.
  void set_project_root(const std::string &root) { project_root_ = root; }

  /// Whether resolve_project_root() already ran.
  bool project_root_resolved() const { return project_root_resolved_; }

  /**
   * Resolve the project root against the configuration file's directory.
   *
   * @param base_dir Directory containing the configuration source.
   * @throws std::logic_error When the root was already resolved.
   */
  void resolve_project_root(const std::filesystem::path &base_dir);

  /// Upstream repository.
  const RepositoryConfig &repository() const { return repository_; }

  /// Set upstream repository.
  void set_repository(RepositoryConfig repository) {
    repository_ = std::move(repository);
  }

  /// Target labels in precedence order.
  const std::vector<TargetLabel> &labels() const { return labels_; }

  /// Replace target labels.
  void set_labels(std::vector<TargetLabel> labels) {
    labels_ = std::move(labels);
  }

  /// Required base commits keyed by branch name.
  const std::unordered_map<std::string, std::string> &
  required_base_commits() const {
    return required_base_commits_;
  }

  /// Replace required base commits.
  void set_required_base_commits(
      std::unordered_map<std::string, std::string> commits) {
    required_base_commits_ = std::move(commits);
  }

  /// Required base commit for @p branch, if one is configured.
  std::optional<std::string>
  required_base_commit(const std::string &branch) const;

  /// Pattern identifying the CLA signed label.
  const LabelPattern &cla_signed_label() const { return cla_signed_label_; }

  void set_cla_signed_label(LabelPattern pattern) {
    cla_signed_label_ = std::move(pattern);
  }

  /// Pattern identifying the merge ready label.
  const LabelPattern &merge_ready_label() const { return merge_ready_label_; }

  void set_merge_ready_label(LabelPattern pattern) {
    merge_ready_label_ = std::move(pattern);
  }

  /// Pattern identifying the commit message fixup label, when configured.
  const std::optional<LabelPattern> &commit_message_fixup_label() const {
    return commit_message_fixup_label_;
  }

  void set_commit_message_fixup_label(std::optional<LabelPattern> pattern) {
    commit_message_fixup_label_ = std::move(pattern);
  }

  /// Whether pull requests are merged through the GitHub API.
  bool github_api_merge_enabled() const {
    return github_api_merge_.has_value();
  }

  /// Merge strategy object; std::nullopt when `githubApiMerge` is false.
  const std::optional<nlohmann::json> &github_api_merge() const {
    return github_api_merge_;
  }

  void set_github_api_merge(std::optional<nlohmann::json> strategy) {
    github_api_merge_ = std::move(strategy);
  }

  /**
   * Build a configuration from a validated raw document.
   *
   * The project root is stored as written; callers resolve it afterwards.
   *
   * @param raw Document accepted by validate_config().
   * @param functions Branch functions that `{"function": name}` entries
   *        refer to.
   * @throws nlohmann::json::exception When required values are missing or
   *         have the wrong type.
   * @throws std::invalid_argument When a target label cannot be built.
   * @throws std::regex_error When a regex pattern does not compile.
   */
  static Config from_json(const nlohmann::json &raw,
                          const BranchFunctionRegistry &functions = {});

  /**
   * Render the configuration in its file form.
   *
   * Derived branch lists are rendered as `{"derived": description}`.
   */
  nlohmann::json to_json() const;

private:
  std::string project_root_;
  bool project_root_resolved_{false};
  RepositoryConfig repository_;
  std::vector<TargetLabel> labels_;
  std::unordered_map<std::string, std::string> required_base_commits_;
  LabelPattern cla_signed_label_;
  LabelPattern merge_ready_label_;
  std::optional<LabelPattern> commit_message_fixup_label_;
  std::optional<nlohmann::json> github_api_merge_;
};

/**
 * Build the branch specification of a target label from its raw value.
 *
 * Accepts a list of branch names, `{"template": [...]}` or
 * `{"function": "name"}`.
 *
 * @throws std::invalid_argument With a message completing the sentence
 *         "Target label #N ...".
 */
BranchSpec branch_spec_from_json(const nlohmann::json &value,
                                 const BranchFunctionRegistry &functions);

/**
 * Read a YAML, JSON, or TOML configuration file into a JSON document.
 *
 * The format is inferred from the file extension.
 *
 * @param path Filesystem location of the configuration file.
 * @return Document with the file's content.
 * @throws std::runtime_error When the file cannot be opened or parsed, or
 *         when the extension is unsupported.
 */
nlohmann::json load_config_document(const std::string &path);

} // namespace prmerge

#endif // PRMERGE_CONFIG_HPP
