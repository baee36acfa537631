/**
 * @file test_config.cpp
 * @brief Configuration loading and fingerprint tests
 */

#include "lintcache/config.hpp"
#include "lintcache/linter_cache.hpp"

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

using lintcache::config::LintConfig;
using json = nlohmann::json;

namespace {

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

json make_config_json()
{
    return json{
        {"cache_path",                                                "build/lint.json"},
        {     "rules", {{"line_length", {{"warning", 120}, {"error", 200}}}, {"todo", false}}},
        {  "included",                                          json::array({"Sources"})},
        {  "excluded",                                  json::array({"Sources/Generated"})}
    };
}

}  // namespace

TEST(LintConfigLoad, ParsesValidDocument)
{
    auto config = lintcache::config::parse_config(make_config_json(), LINTCACHE_SCHEMA_DIR);
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->cache_path, "build/lint.json");
    EXPECT_TRUE(config->use_cache);
    EXPECT_EQ(config->rules.at("line_length").at("warning"), 120);
    ASSERT_EQ(config->included.size(), 1U);
    EXPECT_EQ(config->included.at(0), "Sources");
    ASSERT_EQ(config->excluded.size(), 1U);
    EXPECT_EQ(config->excluded.at(0), "Sources/Generated");
}

TEST(LintConfigLoad, RejectsUnknownKeysAndWrongTypes)
{
    json unknown = make_config_json();
    unknown["colour"] = "blue";
    auto result = lintcache::config::parse_config(unknown, LINTCACHE_SCHEMA_DIR);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");

    json wrong_type = make_config_json();
    wrong_type["use_cache"] = "yes";
    result = lintcache::config::parse_config(wrong_type, LINTCACHE_SCHEMA_DIR);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(LintConfigLoad, LoadReportsMissingAndMalformedFiles)
{
    TempDir temp_dir("lintcache_config_load_test");

    auto missing = lintcache::config::load_config(temp_dir.path() / "nope.json",
                                                  LINTCACHE_SCHEMA_DIR);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, "IOError");

    const auto path = temp_dir.path() / "broken.json";
    {
        std::ofstream out(path);
        out << "{ \"rules\": ";
    }
    auto broken = lintcache::config::load_config(path, LINTCACHE_SCHEMA_DIR);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().code, "ParseError");
}

TEST(ConfigurationHash, IgnoresKeyOrderAndCacheLocation)
{
    LintConfig first;
    first.rules["b"] = 1;
    first.rules["a"] = json{{"y", 2}, {"x", 1}};
    first.included = {"Sources"};

    LintConfig second;
    second.rules["a"] = json{{"x", 1}, {"y", 2}};
    second.rules["b"] = 1;
    second.included = {"Sources"};
    second.cache_path = "elsewhere.json";
    second.use_cache = false;

    auto h1 = lintcache::config::configuration_hash(first);
    auto h2 = lintcache::config::configuration_hash(second);
    ASSERT_TRUE(h1.has_value());
    ASSERT_TRUE(h2.has_value());
    EXPECT_EQ(*h1, *h2);
}

TEST(ConfigurationHash, ChangesWithRulesAndPaths)
{
    LintConfig base;
    base.rules["line_length"] = 120;

    LintConfig other_rule = base;
    other_rule.rules["line_length"] = 100;

    LintConfig other_paths = base;
    other_paths.excluded = {"Pods"};

    auto h_base = lintcache::config::configuration_hash(base);
    auto h_rule = lintcache::config::configuration_hash(other_rule);
    auto h_paths = lintcache::config::configuration_hash(other_paths);
    ASSERT_TRUE(h_base && h_rule && h_paths);
    EXPECT_NE(*h_base, *h_rule);
    EXPECT_NE(*h_base, *h_paths);
}

TEST(ConfigurationHash, RejectsFloatingPointSettings)
{
    LintConfig config;
    config.rules["ratio"] = 0.5;
    auto hash = lintcache::config::configuration_hash(config);
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().code, "FloatingPointNotAllowed");
}

TEST(ConfigurationHash, InvalidatesCacheWrittenWithOtherConfig)
{
    LintConfig before;
    before.rules["line_length"] = 120;
    LintConfig after;
    after.rules["line_length"] = 100;

    auto before_hash = lintcache::config::configuration_hash(before);
    auto after_hash = lintcache::config::configuration_hash(after);
    ASSERT_TRUE(before_hash && after_hash);

    lintcache::cache::LinterCache cache(lintcache::Version::current(), *before_hash);
    auto document = cache.to_json();

    EXPECT_TRUE(lintcache::cache::LinterCache::from_json(
                    document, lintcache::Version::current(), *before_hash)
                    .has_value());
    auto reloaded = lintcache::cache::LinterCache::from_json(
        document, lintcache::Version::current(), *after_hash);
    ASSERT_FALSE(reloaded.has_value());
    EXPECT_EQ(reloaded.error().code, "DifferentConfiguration");
}

TEST(DefaultCachePath, ResolvesAgainstBaseDirectory)
{
    const std::filesystem::path base = "/work/project";

    LintConfig no_path;
    EXPECT_EQ(lintcache::config::default_cache_path(no_path, base), base / "lintcache.json");

    LintConfig relative;
    relative.cache_path = "build/lint.json";
    EXPECT_EQ(lintcache::config::default_cache_path(relative, base), base / "build/lint.json");

    LintConfig absolute;
    absolute.cache_path = "/tmp/lint.json";
    EXPECT_EQ(lintcache::config::default_cache_path(absolute, base),
              std::filesystem::path("/tmp/lint.json"));
}
