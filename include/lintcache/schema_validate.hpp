#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "lintcache/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace lintcache::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings as "lintcache:schema/<name>", resolved to
 * "<schema dir>/<name>.schema.json".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] lintcache::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

}  // namespace lintcache::common
