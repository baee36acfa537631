#pragma once

/**
 * @file config.hpp
 * @brief Lint configuration loading and cache fingerprinting
 */

#include "lintcache/common.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lintcache::config {

/**
 * @brief Configuration of a lint run, as far as the cache is concerned
 *
 * Only rules, included and excluded take part in the configuration hash;
 * cache_path and use_cache change where and whether the cache is used, not
 * what a cached result means.
 */
struct LintConfig
{
    std::optional<std::string> cache_path;
    bool use_cache = true;
    nlohmann::json rules = nlohmann::json::object();  ///< rule id -> settings
    std::vector<std::string> included;
    std::vector<std::string> excluded;
};

/**
 * Build a LintConfig from a parsed document after validating it against
 * "<schema_dir>/config.v1.schema.json".
 */
[[nodiscard]] lintcache::Result<LintConfig> parse_config(const nlohmann::json& document,
                                                         const std::string& schema_dir);

/**
 * Read, parse and validate a configuration file.
 * @return Config, or IOError / ParseError / SchemaValidationFailed
 */
[[nodiscard]] lintcache::Result<LintConfig> load_config(const std::filesystem::path& path,
                                                        const std::string& schema_dir);

/**
 * Fingerprint of the cache-relevant part of @p config.
 *
 * Stable across key insertion order; fails with FloatingPointNotAllowed if a
 * rule setting holds a non-integer number.
 */
[[nodiscard]] lintcache::Result<std::int64_t> configuration_hash(const LintConfig& config);

/// cache_path when set (relative paths resolved against @p base_dir), else base_dir/kCacheFileName.
[[nodiscard]] std::filesystem::path default_cache_path(const LintConfig& config,
                                                       const std::filesystem::path& base_dir);

}  // namespace lintcache::config
