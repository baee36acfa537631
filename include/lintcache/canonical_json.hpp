#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for configuration fingerprints
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (no floating point in fingerprint scope)
 */

#include "lintcache/common.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace lintcache::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] lintcache::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute a signed 64-bit fingerprint of canonical JSON
 *
 * The value is the first 8 bytes (big-endian) of the SHA-256 digest of the
 * canonical form, reinterpreted as a two's complement integer.
 */
[[nodiscard]] lintcache::Result<std::int64_t> fingerprint64(const nlohmann::json& j);

}  // namespace lintcache::canonical
