#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, SHA-256
 */

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace lintcache {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace lintcache

namespace lintcache::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

using Sha256Digest = std::array<std::uint8_t, 32>;

/**
 * Compute the raw SHA-256 digest of data
 * @param data Input bytes
 * @return 32-byte digest
 */
[[nodiscard]] Sha256Digest sha256_digest(std::string_view data);

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

}  // namespace lintcache::common
