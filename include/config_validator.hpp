/**
 * @file config_validator.hpp
 * @brief Structural validation of merge configuration documents.
 *
 * Validation accumulates every problem it finds so a configuration author
 * sees all of them at once. Load failures and structural errors share the
 * same result type.
 */

#ifndef PRMERGE_CONFIG_VALIDATOR_HPP
#define PRMERGE_CONFIG_VALIDATOR_HPP

#include "config.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace prmerge {

/// Prefix of the single error reported when a source cannot be loaded.
inline constexpr const char *kLoadErrorPrefix =
    "File could not be loaded. Error: ";

/**
 * Outcome of loading and validating a configuration.
 *
 * Exactly one of @ref config and @ref errors is populated.
 */
struct ConfigLoadResult {
  std::optional<Config> config;    ///< Validated configuration on success.
  std::vector<std::string> errors; ///< Human readable failures otherwise.

  bool ok() const { return config.has_value() && errors.empty(); }
};

/**
 * Check a raw configuration document for structural completeness.
 *
 * All checks run; the returned list is empty when the document is valid.
 *
 * @param raw Document as materialized from the configuration source.
 * @param functions Branch functions that target labels may refer to.
 * @return Ordered, distinct error messages.
 */
std::vector<std::string>
validate_config(const nlohmann::json &raw,
                const BranchFunctionRegistry &functions = {});

/**
 * Validate @p raw and build the configuration it describes.
 *
 * On success the project root is resolved against @p base_dir.
 *
 * @param raw Document as materialized from the configuration source.
 * @param base_dir Directory containing the configuration source.
 * @param functions Branch functions that target labels may refer to.
 */
ConfigLoadResult
validate_and_build(const nlohmann::json &raw,
                   const std::filesystem::path &base_dir,
                   const BranchFunctionRegistry &functions = {});

/**
 * Read, validate and build the configuration stored at @p path.
 *
 * Any failure to read or parse the file yields a single error starting with
 * kLoadErrorPrefix.
 *
 * @param path YAML, JSON, or TOML configuration file.
 * @param functions Branch functions that target labels may refer to.
 */
ConfigLoadResult
read_and_validate_config(const std::string &path,
                         const BranchFunctionRegistry &functions = {});

} // namespace prmerge

#endif // PRMERGE_CONFIG_VALIDATOR_HPP
