/**
 * @file label_resolver.cpp
 * @brief Implements category classification and target branch resolution.
 */
#include "label_resolver.hpp"

#include <exception>
#include <utility>

namespace prmerge {

namespace {
std::string join_labels(const std::vector<std::string> &labels) {
  if (labels.empty()) {
    return "(none)";
  }
  std::string out;
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += '"' + labels[i] + '"';
  }
  return out;
}
} // namespace

NoMatchingTargetLabelError::NoMatchingTargetLabelError(
    std::vector<std::string> labels)
    : TargetLabelError("No target label matched the pull request labels: " +
                       join_labels(labels)),
      labels_(std::move(labels)) {}

BranchResolutionError::BranchResolutionError(std::string pattern,
                                             std::string target_branch,
                                             const std::string &reason)
    : TargetLabelError("Could not resolve branches of target label '" +
                       pattern + "' for target branch '" + target_branch +
                       "': " + reason),
      pattern_(std::move(pattern)), target_branch_(std::move(target_branch)) {}

LabelCategories
classify_labels(const std::vector<std::string> &labels,
                const LabelPattern &cla_signed, const LabelPattern &merge_ready,
                const std::optional<LabelPattern> &commit_message_fixup) {
  LabelCategories categories;
  categories.cla_signed = cla_signed.matches_any(labels);
  categories.merge_ready = merge_ready.matches_any(labels);
  categories.commit_message_fixup =
      commit_message_fixup && commit_message_fixup->matches_any(labels);
  return categories;
}

LabelCategories classify_labels(const Config &config,
                                const std::vector<std::string> &labels) {
  return classify_labels(labels, config.cla_signed_label(),
                         config.merge_ready_label(),
                         config.commit_message_fixup_label());
}

TargetResolution
resolve_target_branches(const std::vector<TargetLabel> &target_labels,
                        const std::vector<std::string> &labels,
                        const std::string &target_branch) {
  std::optional<TargetResolution> selected;
  for (std::size_t i = 0; i < target_labels.size(); ++i) {
    auto matched = target_labels[i].pattern.first_match(labels);
    if (!matched) {
      continue;
    }
    if (selected) {
      selected->shadowed.push_back(i);
      continue;
    }
    selected.emplace();
    selected->label_index = i;
    selected->matched_label = std::move(*matched);
  }
  if (!selected) {
    throw NoMatchingTargetLabelError(labels);
  }

  const TargetLabel &winner = target_labels[selected->label_index];
  try {
    selected->branches = winner.branches.resolve(target_branch);
  } catch (const std::exception &e) {
    throw BranchResolutionError(winner.pattern.to_string(), target_branch,
                                e.what());
  } catch (...) {
    throw BranchResolutionError(winner.pattern.to_string(), target_branch,
                                "unknown error");
  }
  return std::move(*selected);
}

TargetResolution resolve_target_branches(const Config &config,
                                         const std::vector<std::string> &labels,
                                         const std::string &target_branch) {
  return resolve_target_branches(config.labels(), labels, target_branch);
}

} // namespace prmerge
