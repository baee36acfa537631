/**
 * @file linter_cache.cpp
 * @brief Persisted per-file lint result cache implementation
 */

#include "lintcache/linter_cache.hpp"

#include <atomic>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <ranges>
#include <system_error>
#include <thread>
#include <utility>

namespace lintcache::cache {

namespace {

namespace fs = std::filesystem;

constexpr const char* kVersionKey = "version";
constexpr const char* kConfigurationHashKey = "configuration_hash";
constexpr const char* kLastRunDateKey = "last_run_date";
constexpr const char* kFilesKey = "files";
constexpr const char* kViolationsKey = "violations";

[[nodiscard]] lintcache::Error cache_error(CacheError error, std::string message)
{
    return Error::make(std::string(to_string(error)), std::move(message));
}

[[nodiscard]] std::optional<std::string> read_version(const nlohmann::json& document)
{
    auto it = document.find(kVersionKey);
    if (it == document.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// Non-integer and out-of-range values read as absent, never as zero.
[[nodiscard]] std::optional<std::int64_t> read_configuration_hash(const nlohmann::json& document)
{
    auto it = document.find(kConfigurationHashKey);
    if (it == document.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<double> read_last_run_date(const nlohmann::json& document)
{
    auto it = document.find(kLastRunDateKey);
    if (it == document.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

[[nodiscard]] std::string describe(const std::optional<std::int64_t>& hash)
{
    return hash ? std::to_string(*hash) : std::string("<none>");
}

/// Sibling of @p path unique to this call, so concurrent saves never share a temporary.
[[nodiscard]] fs::path unique_temp_path(const fs::path& path)
{
    static std::atomic<std::uint64_t> counter{0};
    fs::path temp_path = path;
    temp_path += std::format(".{:x}.{}.tmp",
                             std::hash<std::thread::id>{}(std::this_thread::get_id()),
                             counter.fetch_add(1, std::memory_order_relaxed));
    return temp_path;
}

[[nodiscard]] lintcache::VoidResult write_file_atomically(const fs::path& path,
                                                          const std::string& content)
{
    const fs::path temp_path = unique_temp_path(path);

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(
                Error::make("IOError", "Failed to open file for write: " + temp_path.string()));
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return std::unexpected(
                Error::make("IOError", "Failed to write file: " + temp_path.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return std::unexpected(Error::make(
            "IOError",
            std::format("Failed to replace {}: {}", path.string(), ec.message())));
    }
    return {};
}

}  // namespace

// ============================================================================
// ReferenceClock
// ============================================================================

ReferenceClock::time_point ReferenceClock::now() noexcept
{
    return from_sys(std::chrono::system_clock::now());
}

ReferenceClock::time_point ReferenceClock::from_sys(std::chrono::system_clock::time_point tp) noexcept
{
    return time_point(std::chrono::duration_cast<duration>(tp.time_since_epoch())
                      - kUnixEpochOffset);
}

std::chrono::system_clock::time_point ReferenceClock::to_sys(time_point tp) noexcept
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(tp.time_since_epoch()
                                                                        + kUnixEpochOffset));
}

// ============================================================================
// CacheError
// ============================================================================

std::string_view to_string(CacheError error)
{
    switch (error) {
        case CacheError::kInvalidFormat:
            return "InvalidFormat";
        case CacheError::kDifferentVersion:
            return "DifferentVersion";
        case CacheError::kDifferentConfiguration:
            return "DifferentConfiguration";
        case CacheError::kInconsistentLastRunDate:
            return "InconsistentLastRunDate";
    }
    return "InvalidFormat";
}

std::optional<CacheError> cache_error_from_code(std::string_view code)
{
    for (auto error : {CacheError::kInvalidFormat,
                       CacheError::kDifferentVersion,
                       CacheError::kDifferentConfiguration,
                       CacheError::kInconsistentLastRunDate}) {
        if (to_string(error) == code) {
            return error;
        }
    }
    return std::nullopt;
}

// ============================================================================
// LinterCache
// ============================================================================

LinterCache::LinterCache(Version current_version, std::optional<std::int64_t> configuration_hash)
    : m_state{.version = std::move(current_version.value),
              .configuration_hash = configuration_hash,
              .last_run_date = std::nullopt,
              .files = {}}
{}

LinterCache::LinterCache(State state)
    : m_state(std::move(state))
{}

LinterCache::LinterCache(LinterCache&& other)
{
    std::lock_guard lock(other.m_mutex);
    m_state = std::move(other.m_state);
}

lintcache::Result<LinterCache> LinterCache::from_json(const nlohmann::json& document,
                                                      const Version& current_version,
                                                      std::optional<std::int64_t> configuration_hash)
{
    if (!document.is_object()) {
        return std::unexpected(cache_error(
            CacheError::kInvalidFormat,
            std::format("Cache document must be an object, got {}", document.type_name())));
    }

    auto version = read_version(document);
    if (version != current_version.value) {
        return std::unexpected(
            cache_error(CacheError::kDifferentVersion,
                        std::format("Cache was written by version {}, running {}",
                                    version.value_or("<none>"),
                                    current_version.value)));
    }

    auto stored_hash = read_configuration_hash(document);
    if (stored_hash != configuration_hash) {
        return std::unexpected(
            cache_error(CacheError::kDifferentConfiguration,
                        std::format("Cache configuration hash {} does not match {}",
                                    describe(stored_hash),
                                    describe(configuration_hash))));
    }

    auto last_run_date = read_last_run_date(document);
    if (last_run_date && *last_run_date > ReferenceClock::now().time_since_epoch().count()) {
        return std::unexpected(cache_error(
            CacheError::kInconsistentLastRunDate,
            std::format("Cache last run date {} is in the future", *last_run_date)));
    }

    State state{.version = std::move(*version),
                .configuration_hash = stored_hash,
                .last_run_date = last_run_date,
                .files = {}};
    if (auto files = document.find(kFilesKey); files != document.end() && files->is_object()) {
        for (const auto& [file, entry] : files->items()) {
            state.files.emplace(file, entry);
        }
    }
    return LinterCache(std::move(state));
}

lintcache::Result<LinterCache> LinterCache::load(const std::filesystem::path& path,
                                                 const Version& current_version,
                                                 std::optional<std::int64_t> configuration_hash)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(
            Error::make("IOError", "Failed to open file for read: " + path.string()));
    }

    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(Error::make("IOError", "Failed to read file: " + path.string()));
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            "ParseError",
            std::format("Failed to parse JSON from {}: {}", path.string(), ex.what())));
    }

    return from_json(document, current_version, configuration_hash);
}

std::string LinterCache::version() const
{
    std::lock_guard lock(m_mutex);
    return m_state.version;
}

std::optional<std::int64_t> LinterCache::configuration_hash() const
{
    std::lock_guard lock(m_mutex);
    return m_state.configuration_hash;
}

std::optional<ReferenceClock::time_point> LinterCache::last_run_date() const
{
    std::lock_guard lock(m_mutex);
    if (!m_state.last_run_date) {
        return std::nullopt;
    }
    return ReferenceClock::time_point(ReferenceClock::duration(*m_state.last_run_date));
}

void LinterCache::set_last_run_date(std::optional<ReferenceClock::time_point> date)
{
    std::lock_guard lock(m_mutex);
    if (date) {
        m_state.last_run_date = date->time_since_epoch().count();
    } else {
        m_state.last_run_date.reset();
    }
}

void LinterCache::cache_violations(const std::vector<model::Violation>& violations,
                                   const std::string& file)
{
    nlohmann::json records = nlohmann::json::array();
    for (const auto& violation : violations) {
        records.push_back(model::to_cache_record(violation));
    }
    nlohmann::json entry = {
        {kViolationsKey, std::move(records)}
    };

    std::lock_guard lock(m_mutex);
    m_state.files.insert_or_assign(file, std::move(entry));
}

void LinterCache::clear_violations(const std::string& file)
{
    // Written as an empty array, the on-disk shape existing caches use for cleared files.
    std::lock_guard lock(m_mutex);
    m_state.files.insert_or_assign(file, nlohmann::json::array());
}

std::optional<std::vector<model::Violation>> LinterCache::violations(const std::string& file) const
{
    nlohmann::json records;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_state.files.find(file);
        if (it == m_state.files.end() || !it->second.is_object()) {
            return std::nullopt;
        }
        auto records_it = it->second.find(kViolationsKey);
        if (records_it == it->second.end() || !records_it->is_array()) {
            return std::nullopt;
        }
        records = *records_it;
    }

    std::vector<model::Violation> result;
    result.reserve(records.size());
    for (const auto& record : records) {
        if (auto violation = model::violation_from_cache_record(record, file)) {
            result.push_back(std::move(*violation));
        }
    }
    return result;
}

std::vector<std::string> LinterCache::files() const
{
    std::lock_guard lock(m_mutex);
    auto keys = m_state.files | std::views::keys;
    std::vector<std::string> result(keys.begin(), keys.end());
    return result;
}

nlohmann::json LinterCache::to_json() const
{
    std::lock_guard lock(m_mutex);
    return to_json_locked();
}

nlohmann::json LinterCache::to_json_locked() const
{
    nlohmann::json document = {
        {kVersionKey, m_state.version},
        {  kFilesKey, nlohmann::json::object()}
    };
    if (m_state.configuration_hash) {
        document[kConfigurationHashKey] = *m_state.configuration_hash;
    }
    if (m_state.last_run_date) {
        document[kLastRunDateKey] = *m_state.last_run_date;
    }
    auto& files = document[kFilesKey];
    for (const auto& [file, entry] : m_state.files) {
        files[file] = entry;
    }
    return document;
}

lintcache::VoidResult LinterCache::save(const std::filesystem::path& path)
{
    set_last_run_date(ReferenceClock::now());

    std::string content;
    {
        std::lock_guard lock(m_mutex);
        try {
            content = to_json_locked().dump(2);
        } catch (const nlohmann::json::type_error& ex) {
            return std::unexpected(Error::make(
                "IOError", std::format("Failed to encode cache as UTF-8 JSON: {}", ex.what())));
        }
    }

    return write_file_atomically(path, content);
}

}  // namespace lintcache::cache
