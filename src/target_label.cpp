/**
 * @file target_label.cpp
 * @brief Implements fixed, function and template branch specifications.
 */
#include "target_label.hpp"

#include <stdexcept>
#include <utility>

namespace prmerge {
namespace {
std::string substitute_target(std::string text, const std::string &target) {
  const std::string placeholder{BranchSpec::kTargetPlaceholder};
  std::size_t pos = 0;
  while ((pos = text.find(placeholder, pos)) != std::string::npos) {
    text.replace(pos, placeholder.size(), target);
    pos += target.size();
  }
  return text;
}
} // namespace

BranchSpec BranchSpec::fixed(std::vector<std::string> branches) {
  BranchSpec spec;
  spec.kind_ = Kind::Fixed;
  spec.branches_ = std::move(branches);
  return spec;
}

BranchSpec BranchSpec::derived(BranchFunction function,
                               std::string description) {
  if (!function) {
    throw std::invalid_argument("Derived branch spec requires a function");
  }
  BranchSpec spec;
  spec.kind_ = Kind::Derived;
  spec.function_ = std::move(function);
  spec.description_ = std::move(description);
  return spec;
}

BranchSpec BranchSpec::from_template(std::vector<std::string> templates) {
  std::string description = "template:[";
  for (std::size_t i = 0; i < templates.size(); ++i) {
    if (i != 0) {
      description += ", ";
    }
    description += templates[i];
  }
  description += ']';
  std::vector<std::string> kept = templates;
  BranchSpec spec = derived(
      [templates = std::move(templates)](const std::string &target) {
        std::vector<std::string> out;
        out.reserve(templates.size());
        for (const auto &entry : templates) {
          out.push_back(substitute_target(entry, target));
        }
        return out;
      },
      std::move(description));
  spec.templates_ = std::move(kept);
  return spec;
}

std::vector<std::string>
BranchSpec::resolve(const std::string &target_branch) const {
  if (kind_ == Kind::Fixed) {
    return branches_;
  }
  return function_(target_branch);
}

} // namespace prmerge
