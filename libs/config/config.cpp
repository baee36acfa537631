/**
 * @file config.cpp
 * @brief Lint configuration loading and cache fingerprinting
 */

#include "lintcache/config.hpp"

#include "lintcache/canonical_json.hpp"
#include "lintcache/schema_validate.hpp"
#include "lintcache/version.hpp"

#include <format>
#include <fstream>

namespace lintcache::config {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] std::string config_schema_path(const std::string& schema_dir)
{
    return (fs::path(schema_dir) / "config.v1.schema.json").string();
}

[[nodiscard]] std::vector<std::string> string_list(const nlohmann::json& document, const char* key)
{
    std::vector<std::string> values;
    if (auto it = document.find(key); it != document.end()) {
        for (const auto& item : *it) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

}  // namespace

lintcache::Result<LintConfig> parse_config(const nlohmann::json& document,
                                           const std::string& schema_dir)
{
    if (auto result = common::validate_json(document, config_schema_path(schema_dir)); !result) {
        return std::unexpected(
            Error::make(result.error().code,
                        "Configuration schema validation failed: " + result.error().message));
    }

    // Shapes below are guaranteed by the schema.
    LintConfig config;
    if (auto it = document.find("cache_path"); it != document.end()) {
        config.cache_path = it->get<std::string>();
    }
    config.use_cache = document.value("use_cache", true);
    if (auto it = document.find("rules"); it != document.end()) {
        config.rules = *it;
    }
    config.included = string_list(document, "included");
    config.excluded = string_list(document, "excluded");
    return config;
}

lintcache::Result<LintConfig> load_config(const std::filesystem::path& path,
                                          const std::string& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open configuration file: " + path.string()));
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            "ParseError",
            std::format("Failed to parse configuration file {}: {}", path.string(), ex.what())));
    }

    return parse_config(document, schema_dir);
}

lintcache::Result<std::int64_t> configuration_hash(const LintConfig& config)
{
    nlohmann::json relevant = {
        {   "rules",    config.rules},
        {"included", config.included},
        {"excluded", config.excluded}
    };
    return canonical::fingerprint64(relevant);
}

std::filesystem::path default_cache_path(const LintConfig& config,
                                         const std::filesystem::path& base_dir)
{
    if (!config.cache_path) {
        return base_dir / kCacheFileName;
    }
    fs::path path(*config.cache_path);
    if (path.is_absolute()) {
        return path;
    }
    return base_dir / path;
}

}  // namespace lintcache::config
