#pragma once

/**
 * @file version.hpp
 * @brief lintcache version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

#include <string>

namespace lintcache {

/// Tool version string, recorded in every persisted cache
constexpr const char* kVersion = "0.2.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Default cache file name when the configuration does not name one
constexpr const char* kCacheFileName = "lintcache.json";

/**
 * @brief Version a cache document must carry to be reused
 */
struct Version
{
    std::string value;

    [[nodiscard]] static Version current() { return Version{.value = kVersion}; }

    friend bool operator==(const Version&, const Version&) = default;
};

}  // namespace lintcache
