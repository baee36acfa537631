#pragma once

/**
 * @file linter_cache.hpp
 * @brief Persisted per-file lint result cache
 *
 * The cache is one JSON document:
 *   {"version": "...", "configuration_hash": <int>, "last_run_date": <seconds>,
 *    "files": {"<path>": {"violations": [<record>...]}}}
 *
 * A cache is only reusable by the tool version and configuration that wrote
 * it. Every accessor is thread-safe; a single mutex guards the whole state.
 */

#include "lintcache/common.hpp"
#include "lintcache/version.hpp"
#include "lintcache/violation.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace lintcache::cache {

/**
 * @brief Clock measuring seconds since 2001-01-01T00:00:00Z
 *
 * "last_run_date" is stored in this clock's representation, so a time point
 * survives a save/load round trip bit-for-bit.
 */
struct ReferenceClock
{
    using rep = double;
    using period = std::ratio<1>;
    using duration = std::chrono::duration<rep, period>;
    using time_point = std::chrono::time_point<ReferenceClock>;
    static constexpr bool is_steady = false;

    /// Offset of the reference epoch from the Unix epoch
    static constexpr std::chrono::seconds kUnixEpochOffset{978'307'200};

    [[nodiscard]] static time_point now() noexcept;
    [[nodiscard]] static time_point from_sys(std::chrono::system_clock::time_point tp) noexcept;
    [[nodiscard]] static std::chrono::system_clock::time_point to_sys(time_point tp) noexcept;
};

/**
 * Reasons a persisted cache is rejected at construction, in check order.
 * Error::code carries the string form.
 */
enum class CacheError {
    kInvalidFormat,           ///< Top-level value is not an object
    kDifferentVersion,        ///< "version" differs from the running tool
    kDifferentConfiguration,  ///< "configuration_hash" differs from the active config
    kInconsistentLastRunDate  ///< "last_run_date" lies in the future
};

[[nodiscard]] std::string_view to_string(CacheError error);
[[nodiscard]] std::optional<CacheError> cache_error_from_code(std::string_view code);

class LinterCache {
public:
    /// Fresh, empty cache for the given version and configuration.
    explicit LinterCache(Version current_version = Version::current(),
                         std::optional<std::int64_t> configuration_hash = std::nullopt);

    /**
     * @brief Rebuild a cache from a parsed document
     *
     * Checks, in order: object → version → configuration hash → last run date.
     * File entries are kept as-is and decoded lazily by violations().
     * @return Cache, or an error whose code is one of the CacheError names
     */
    [[nodiscard]] static lintcache::Result<LinterCache>
    from_json(const nlohmann::json& document,
              const Version& current_version = Version::current(),
              std::optional<std::int64_t> configuration_hash = std::nullopt);

    /**
     * @brief Read and parse a cache file, then delegate to from_json()
     * @return Cache, IOError/ParseError for unreadable files, or a CacheError
     */
    [[nodiscard]] static lintcache::Result<LinterCache>
    load(const std::filesystem::path& path,
         const Version& current_version = Version::current(),
         std::optional<std::int64_t> configuration_hash = std::nullopt);

    /// Move is only valid before the cache is shared between threads.
    LinterCache(LinterCache&& other);
    LinterCache& operator=(LinterCache&&) = delete;
    LinterCache(const LinterCache&) = delete;
    LinterCache& operator=(const LinterCache&) = delete;
    ~LinterCache() = default;

    [[nodiscard]] std::string version() const;
    [[nodiscard]] std::optional<std::int64_t> configuration_hash() const;

    [[nodiscard]] std::optional<ReferenceClock::time_point> last_run_date() const;
    void set_last_run_date(std::optional<ReferenceClock::time_point> date);

    /// Replace (never merge) the cached violations of @p file.
    void cache_violations(const std::vector<model::Violation>& violations, const std::string& file);

    /// Forget the cached violations of @p file; violations() then returns nullopt.
    void clear_violations(const std::string& file);

    /**
     * @brief Cached violations of @p file, in the order they were cached
     *
     * std::nullopt if the file has no readable entry. Records that cannot be
     * decoded are skipped individually.
     */
    [[nodiscard]] std::optional<std::vector<model::Violation>>
    violations(const std::string& file) const;

    /// Keys of every file entry, readable or not, in lexicographic order.
    [[nodiscard]] std::vector<std::string> files() const;

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Stamp last_run_date with now and write the document to @p path
     *
     * The file is replaced atomically through a sibling temporary file whose
     * name is unique per call, so concurrent saves to one path all succeed.
     * Serialization happens under the lock, the write does not.
     */
    [[nodiscard]] lintcache::VoidResult save(const std::filesystem::path& path);

private:
    struct State
    {
        std::string version;
        std::optional<std::int64_t> configuration_hash;
        std::optional<double> last_run_date;
        std::map<std::string, nlohmann::json> files;
    };

    explicit LinterCache(State state);

    [[nodiscard]] nlohmann::json to_json_locked() const;

    mutable std::mutex m_mutex;
    State m_state;
};

}  // namespace lintcache::cache
