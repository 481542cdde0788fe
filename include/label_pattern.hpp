/**
 * @file label_pattern.hpp
 * @brief Exact-or-regex matcher for pull request label names.
 */

#ifndef PRMERGE_LABEL_PATTERN_HPP
#define PRMERGE_LABEL_PATTERN_HPP

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace prmerge {

/**
 * @brief Pattern matched against the names of labels on a pull request.
 *
 * An exact pattern matches a label whose name is identical. A regex pattern
 * matches a label when the expression is found anywhere inside the name, so
 * `target:.*` matches `"target: minor"` without anchors.
 */
class LabelPattern {
public:
  /** \brief How the pattern text is interpreted. */
  enum class Kind {
    Exact, ///< Literal label name compared by equality.
    Regex  ///< ECMAScript regular expression searched within the name.
  };

  /// Prefix marking a regular expression in configuration files.
  static constexpr const char *kRegexPrefix = "regex:";

  /// Empty exact pattern; only matches a label with an empty name.
  LabelPattern() = default;

  /// Build a pattern that matches one literal label name.
  static LabelPattern exact(std::string name);

  /**
   * Build a pattern from a regular expression.
   *
   * @param expression ECMAScript regular expression.
   * @throws std::regex_error When @p expression does not compile.
   */
  static LabelPattern regex(std::string expression);

  /**
   * Parse the textual form used in configuration files.
   *
   * Text starting with `regex:` becomes a regex pattern built from the
   * remainder; anything else is an exact label name.
   *
   * @throws std::regex_error When the regex remainder does not compile.
   */
  static LabelPattern parse(const std::string &text);

  Kind kind() const { return kind_; }

  /// Label name or expression source, without the `regex:` prefix.
  const std::string &source() const { return source_; }

  /// Check whether @p candidate satisfies this pattern.
  bool matches(const std::string &candidate) const;

  /// Check whether at least one of @p candidates satisfies this pattern.
  bool matches_any(const std::vector<std::string> &candidates) const;

  /**
   * Return the first label in @p candidates satisfying this pattern.
   *
   * @return The matching label, or std::nullopt when none matches.
   */
  std::optional<std::string>
  first_match(const std::vector<std::string> &candidates) const;

  /// Render back to the configuration file form.
  std::string to_string() const;

  bool operator==(const LabelPattern &other) const {
    return kind_ == other.kind_ && source_ == other.source_;
  }
  bool operator!=(const LabelPattern &other) const {
    return !(*this == other);
  }

private:
  LabelPattern(Kind kind, std::string source);

  Kind kind_{Kind::Exact};
  std::string source_;
  std::optional<std::regex> compiled_; ///< Present for Kind::Regex only.
};

} // namespace prmerge

#endif // PRMERGE_LABEL_PATTERN_HPP
