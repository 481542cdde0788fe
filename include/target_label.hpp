/**
 * @file target_label.hpp
 * @brief Target labels and the branch lists they stand for.
 *
 * A target label tells the merge tooling into which branches a pull request
 * is merged. The branch list is either fixed or derived from the target
 * branch the author picked in the GitHub UI.
 */

#ifndef PRMERGE_TARGET_LABEL_HPP
#define PRMERGE_TARGET_LABEL_HPP

#include "label_pattern.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prmerge {

/// Pure function mapping the nominal target branch to destination branches.
using BranchFunction =
    std::function<std::vector<std::string>(const std::string &)>;

/// Named branch functions that configuration files may refer to.
using BranchFunctionRegistry = std::unordered_map<std::string, BranchFunction>;

/**
 * @brief Destination branches of a target label.
 */
class BranchSpec {
public:
  /** \brief Whether the branch list is static or computed. */
  enum class Kind {
    Fixed,  ///< Static ordered branch list.
    Derived ///< Computed from the nominal target branch.
  };

  /// Placeholder replaced by the nominal target branch in templates.
  static constexpr const char *kTargetPlaceholder = "{target}";

  BranchSpec() = default;

  /// Static list returned as-is on resolution.
  static BranchSpec fixed(std::vector<std::string> branches);

  /**
   * Branch list computed by @p function.
   *
   * @param function Callable invoked with the nominal target branch.
   * @param description Human readable origin, used in summaries.
   * @throws std::invalid_argument When @p function is empty.
   */
  static BranchSpec derived(BranchFunction function,
                            std::string description = "function");

  /**
   * Branch list built by substituting `{target}` in every template entry.
   *
   * @param templates Entries such as `"{target}"` or `"{target}-lts"`.
   */
  static BranchSpec from_template(std::vector<std::string> templates);

  Kind kind() const { return kind_; }

  /// Branches of a Fixed spec; empty for Derived specs.
  const std::vector<std::string> &branches() const { return branches_; }

  /// Origin of a Derived spec (`function:<name>`, `template:[...]`).
  const std::string &description() const { return description_; }

  /// Template entries when built by from_template(); empty otherwise.
  const std::vector<std::string> &templates() const { return templates_; }

  /**
   * Produce the destination branches for @p target_branch.
   *
   * Derived functions may throw; exceptions propagate unchanged.
   */
  std::vector<std::string> resolve(const std::string &target_branch) const;

private:
  Kind kind_{Kind::Fixed};
  std::vector<std::string> branches_;
  BranchFunction function_;
  std::string description_;
  std::vector<std::string> templates_;
};

/**
 * @brief Pattern for a pull request label paired with its branches.
 */
struct TargetLabel {
  LabelPattern pattern; ///< Matches label names on the pull request.
  BranchSpec branches;  ///< Destinations implied by the label.
};

} // namespace prmerge

#endif // PRMERGE_TARGET_LABEL_HPP
