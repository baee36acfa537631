/**
 * @file main.cpp
 * @brief lintcache CLI entry point
 *
 * Commands:
 *   inspect      - Summarize a persisted cache
 *   check        - Decide whether a cache is reusable by this version/config
 *   clear        - Drop the cached violations of one file
 *   fingerprint  - Print the configuration hash of a config file
 *   version      - Show version information
 */

#include "lintcache/common.hpp"
#include "lintcache/config.hpp"
#include "lintcache/linter_cache.hpp"
#include "lintcache/version.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitStale = 2;

void print_version()
{
    std::println("lintcache {} ({})", lintcache::kVersion, lintcache::kBuildId);
}

void print_help()
{
    std::print(R"(lintcache - Persisted lint result cache

Usage: lintcache <command> [options]

Commands:
  inspect       Summarize a persisted cache
  check         Check whether a cache is reusable by this version and configuration
  clear         Drop the cached violations of one file
  fingerprint   Print the configuration hash of a configuration file
  version       Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'lintcache <command> --help' for command-specific options.
)");
}

void print_inspect_help()
{
    std::print(R"(Usage: lintcache inspect [options]

Summarize a persisted cache

Options:
  --cache FILE              Path to the cache file
  --config FILE             Configuration the cache was written with; without
                            --cache, its cache_path (or ./lintcache.json) is used
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

void print_check_help()
{
    std::print(R"(Usage: lintcache check [options]

Check whether a cache is reusable by this version and configuration

Options:
  --cache FILE              Path to the cache file
  --config FILE             Active configuration; without --cache, its
                            cache_path (or ./lintcache.json) is used
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help

Exit status:
  0  cache is reusable
  1  cache could not be read
  2  cache must be discarded, or caching is disabled by configuration
)");
}

void print_clear_help()
{
    std::print(R"(Usage: lintcache clear [options]

Drop the cached violations of one file and save the cache

Options:
  --cache FILE              Path to the cache file
  --file PATH               Cached file to clear (required)
  --config FILE             Configuration the cache was written with; without
                            --cache, its cache_path (or ./lintcache.json) is used
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

void print_fingerprint_help()
{
    std::print(R"(Usage: lintcache fingerprint [options]

Print the configuration hash recorded in caches written with a configuration

Options:
  --config FILE             Configuration file (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

struct CacheOptions
{
    std::string cache;
    std::string file;
    std::string config;
    std::string schema_dir;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> lintcache::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            lintcache::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] lintcache::Result<CacheOptions> parse_cache_args(std::span<char*> args)
{
    CacheOptions options{.cache = std::string{},
                         .file = std::string{},
                         .config = std::string{},
                         .schema_dir = "schemas",
                         .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }

        std::string* target = nullptr;
        if (arg == "--cache") {
            target = &options.cache;
        } else if (arg == "--file") {
            target = &options.file;
        } else if (arg == "--config") {
            target = &options.config;
        } else if (arg == "--schema-dir") {
            target = &options.schema_dir;
        } else {
            return std::unexpected(lintcache::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }

        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        *target = *value;
        skip_next = true;
    }
    return options;
}

/// Everything a command derives from --cache and --config.
struct CacheContext
{
    std::optional<lintcache::config::LintConfig> config;
    std::optional<std::int64_t> configuration_hash;
    std::filesystem::path cache_path;
};

/**
 * Load --config when given and pick the cache file.
 *
 * --cache wins; otherwise the path comes from the configuration, resolved
 * against the working directory.
 */
[[nodiscard]] lintcache::Result<CacheContext> resolve_context(const CacheOptions& options)
{
    CacheContext context{.config = std::nullopt,
                         .configuration_hash = std::nullopt,
                         .cache_path = options.cache};
    if (options.config.empty()) {
        return context;
    }

    auto config = lintcache::config::load_config(options.config, options.schema_dir);
    if (!config) {
        return std::unexpected(config.error());
    }
    auto hash = lintcache::config::configuration_hash(*config);
    if (!hash) {
        return std::unexpected(hash.error());
    }
    if (options.cache.empty()) {
        context.cache_path =
            lintcache::config::default_cache_path(*config, std::filesystem::current_path());
    }
    context.config = std::move(*config);
    context.configuration_hash = *hash;
    return context;
}

[[nodiscard]] lintcache::Result<lintcache::cache::LinterCache>
open_cache(const CacheContext& context)
{
    return lintcache::cache::LinterCache::load(context.cache_path,
                                               lintcache::Version::current(),
                                               context.configuration_hash);
}

[[nodiscard]] std::string format_last_run(const lintcache::cache::LinterCache& cache)
{
    auto date = cache.last_run_date();
    if (!date) {
        return "never";
    }
    auto sys = lintcache::cache::ReferenceClock::to_sys(*date);
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(sys));
}

[[nodiscard]] int run_inspect(const CacheOptions& options)
{
    auto context = resolve_context(options);
    if (!context) {
        std::println(stderr, "Error: {}: {}", context.error().code, context.error().message);
        return kExitError;
    }
    auto cache = open_cache(*context);
    if (!cache) {
        std::println(stderr, "Error: {}: {}", cache.error().code, cache.error().message);
        return kExitError;
    }

    std::println("[inspect] {}", context->cache_path.string());
    std::println("  version: {}", cache->version());
    if (auto hash = cache->configuration_hash()) {
        std::println("  configuration_hash: {}", *hash);
    } else {
        std::println("  configuration_hash: <none>");
    }
    std::println("  last_run_date: {}", format_last_run(*cache));

    auto files = cache->files();
    std::println("  files: {}", files.size());
    for (const auto& file : files) {
        if (auto violations = cache->violations(file)) {
            std::println("    {}: {} violation(s)", file, violations->size());
        } else {
            std::println("    {}: <cleared>", file);
        }
    }
    return kExitOk;
}

[[nodiscard]] int run_check(const CacheOptions& options)
{
    auto context = resolve_context(options);
    if (!context) {
        std::println(stderr, "Error: {}: {}", context.error().code, context.error().message);
        return kExitError;
    }
    const auto cache_path = context->cache_path.string();
    if (context->config && !context->config->use_cache) {
        std::println("[check] {} must be discarded: caching disabled by configuration",
                     cache_path);
        return kExitStale;
    }

    auto cache = open_cache(*context);
    if (cache) {
        std::println("[check] {} is reusable ({} file(s))", cache_path, cache->files().size());
        return kExitOk;
    }
    if (lintcache::cache::cache_error_from_code(cache.error().code)) {
        std::println("[check] {} must be discarded: {} ({})",
                     cache_path,
                     cache.error().code,
                     cache.error().message);
        return kExitStale;
    }
    std::println(stderr, "Error: {}: {}", cache.error().code, cache.error().message);
    return kExitError;
}

[[nodiscard]] int run_clear(const CacheOptions& options)
{
    auto context = resolve_context(options);
    if (!context) {
        std::println(stderr, "Error: {}: {}", context.error().code, context.error().message);
        return kExitError;
    }
    auto cache = open_cache(*context);
    if (!cache) {
        std::println(stderr, "Error: {}: {}", cache.error().code, cache.error().message);
        return kExitError;
    }

    cache->clear_violations(options.file);
    if (auto result = cache->save(context->cache_path); !result) {
        std::println(stderr, "Error: failed to save cache: {}", result.error().message);
        return kExitError;
    }

    std::println("[clear] Cleared {}", options.file);
    std::println("  cache: {}", context->cache_path.string());
    return kExitOk;
}

[[nodiscard]] int run_fingerprint(const CacheOptions& options)
{
    auto context = resolve_context(options);
    if (!context) {
        std::println(stderr, "Error: {}: {}", context.error().code, context.error().message);
        return kExitError;
    }
    // cmd_fingerprint requires --config, so the hash is always present.
    std::println("{}", context->configuration_hash.value());
    return kExitOk;
}

int cmd_inspect(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_cache_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_inspect_help();
        return kExitOk;
    }
    if (options->cache.empty() && options->config.empty()) {
        std::println(stderr, "Error: --cache or --config is required");
        print_inspect_help();
        return kExitError;
    }
    return run_inspect(*options);
}

int cmd_check(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_cache_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_check_help();
        return kExitOk;
    }
    if (options->cache.empty() && options->config.empty()) {
        std::println(stderr, "Error: --cache or --config is required");
        print_check_help();
        return kExitError;
    }
    return run_check(*options);
}

int cmd_clear(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_cache_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_clear_help();
        return kExitOk;
    }
    if ((options->cache.empty() && options->config.empty()) || options->file.empty()) {
        std::println(stderr, "Error: --file and one of --cache or --config are required");
        print_clear_help();
        return kExitError;
    }
    return run_clear(*options);
}

int cmd_fingerprint(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_cache_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_fingerprint_help();
        return kExitOk;
    }
    if (options->config.empty()) {
        std::println(stderr, "Error: --config is required");
        print_fingerprint_help();
        return kExitError;
    }
    return run_fingerprint(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitError;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "inspect") {
            return cmd_inspect(sub_argc, sub_argv);
        }
        if (cmd == "check") {
            return cmd_check(sub_argc, sub_argv);
        }
        if (cmd == "clear") {
            return cmd_clear(sub_argc, sub_argv);
        }
        if (cmd == "fingerprint") {
            return cmd_fingerprint(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitError;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
