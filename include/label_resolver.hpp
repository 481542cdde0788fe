/**
 * @file label_resolver.hpp
 * @brief Classification of category labels and resolution of target labels.
 *
 * Both operations are pure functions of their inputs; nothing is cached
 * between calls and nothing is logged.
 */

#ifndef PRMERGE_LABEL_RESOLVER_HPP
#define PRMERGE_LABEL_RESOLVER_HPP

#include "config.hpp"
#include "label_pattern.hpp"
#include "target_label.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace prmerge {

/**
 * @brief Which single-purpose label categories apply to a pull request.
 */
struct LabelCategories {
  bool cla_signed{false};           ///< A CLA signed label is attached.
  bool merge_ready{false};          ///< A merge ready label is attached.
  bool commit_message_fixup{false}; ///< A fixup label is attached.
};

/**
 * Determine which categories the attached labels satisfy.
 *
 * Each category is checked independently; one label may satisfy several.
 * An unset fixup pattern never matches.
 *
 * @param labels Names of the labels attached to the pull request.
 */
LabelCategories
classify_labels(const std::vector<std::string> &labels,
                const LabelPattern &cla_signed, const LabelPattern &merge_ready,
                const std::optional<LabelPattern> &commit_message_fixup);

/// Classify @p labels with the category patterns of @p config.
LabelCategories classify_labels(const Config &config,
                                const std::vector<std::string> &labels);

/**
 * @brief Outcome of a successful target label resolution.
 *
 * An empty @ref branches list is a valid result; callers decide whether a
 * pull request without destinations may proceed.
 */
struct TargetResolution {
  std::vector<std::string> branches; ///< Destination branches in order.
  std::size_t label_index{0};        ///< Index of the selected target label.
  std::string matched_label;         ///< Pull request label that matched.
  /// Later target labels that matched too but lost to configuration order.
  std::vector<std::size_t> shadowed;
};

/**
 * @brief Base class for failures while resolving target labels.
 */
class TargetLabelError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief No configured target label matches the pull request's labels.
 */
class NoMatchingTargetLabelError : public TargetLabelError {
public:
  explicit NoMatchingTargetLabelError(std::vector<std::string> labels);

  /// Labels that were attached to the pull request.
  const std::vector<std::string> &labels() const { return labels_; }

private:
  std::vector<std::string> labels_;
};

/**
 * @brief A derived branch function failed for the selected target label.
 */
class BranchResolutionError : public TargetLabelError {
public:
  BranchResolutionError(std::string pattern, std::string target_branch,
                        const std::string &reason);

  /// Pattern of the target label whose branches failed to resolve.
  const std::string &pattern() const { return pattern_; }

  /// Nominal target branch passed to the function.
  const std::string &target_branch() const { return target_branch_; }

private:
  std::string pattern_;
  std::string target_branch_;
};

/**
 * Resolve the destination branches implied by a pull request's labels.
 *
 * Target labels are evaluated in configuration order and the first whose
 * pattern matches any attached label wins.
 *
 * @param target_labels Configured target labels in precedence order.
 * @param labels Names of the labels attached to the pull request.
 * @param target_branch Branch selected as base in the GitHub UI.
 * @return Branches of the selected target label.
 * @throws NoMatchingTargetLabelError When no target label matches.
 * @throws BranchResolutionError When a derived branch function throws.
 */
TargetResolution
resolve_target_branches(const std::vector<TargetLabel> &target_labels,
                        const std::vector<std::string> &labels,
                        const std::string &target_branch);

/// Resolve with the target labels of @p config.
TargetResolution resolve_target_branches(const Config &config,
                                         const std::vector<std::string> &labels,
                                         const std::string &target_branch);

} // namespace prmerge

#endif // PRMERGE_LABEL_RESOLVER_HPP
