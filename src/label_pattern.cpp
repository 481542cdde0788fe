/**
 * @file label_pattern.cpp
 * @brief Implements exact and regular expression label matching.
 */
#include "label_pattern.hpp"

#include <algorithm>
#include <utility>

namespace prmerge {

LabelPattern::LabelPattern(Kind kind, std::string source)
    : kind_(kind), source_(std::move(source)) {
  if (kind_ == Kind::Regex) {
    compiled_.emplace(source_, std::regex::ECMAScript);
  }
}

LabelPattern LabelPattern::exact(std::string name) {
  return LabelPattern(Kind::Exact, std::move(name));
}

LabelPattern LabelPattern::regex(std::string expression) {
  return LabelPattern(Kind::Regex, std::move(expression));
}

LabelPattern LabelPattern::parse(const std::string &text) {
  const std::string prefix{kRegexPrefix};
  if (text.rfind(prefix, 0) == 0) {
    return regex(text.substr(prefix.size()));
  }
  return exact(text);
}

bool LabelPattern::matches(const std::string &candidate) const {
  if (kind_ == Kind::Exact) {
    return candidate == source_;
  }
  return std::regex_search(candidate, *compiled_);
}

bool LabelPattern::matches_any(
    const std::vector<std::string> &candidates) const {
  return std::any_of(candidates.begin(), candidates.end(),
                     [this](const std::string &c) { return matches(c); });
}

std::optional<std::string>
LabelPattern::first_match(const std::vector<std::string> &candidates) const {
  auto it = std::find_if(candidates.begin(), candidates.end(),
                         [this](const std::string &c) { return matches(c); });
  if (it == candidates.end()) {
    return std::nullopt;
  }
  return *it;
}

std::string LabelPattern::to_string() const {
  if (kind_ == Kind::Regex) {
    return std::string{kRegexPrefix} + source_;
  }
  return source_;
}

} // namespace prmerge
