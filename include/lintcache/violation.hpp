#pragma once

/**
 * @file violation.hpp
 * @brief Lint findings and their cache record encoding
 */

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace lintcache::model {

/**
 * Severity of a finding; serialized as its lowercase name.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class Severity {
    kWarning,
    kError
};

[[nodiscard]] std::string_view to_string(Severity severity);

/// Parse "warning"/"error"; any other spelling is rejected.
[[nodiscard]] std::optional<Severity> severity_from_string(std::string_view value);

/**
 * @brief Position of a finding. Line and character are independent: a
 * finding may carry a line without a column.
 */
struct Location
{
    std::string file;
    std::optional<int> line;
    std::optional<int> character;

    friend bool operator==(const Location&, const Location&) = default;
};

/**
 * @brief One diagnostic produced by a rule
 */
struct Violation
{
    std::string rule_id;    ///< Stable rule identifier, e.g. "line_length"
    std::string rule_name;  ///< Human-readable rule name
    Severity severity;
    Location location;
    std::string reason;

    friend bool operator==(const Violation&, const Violation&) = default;
};

/**
 * Encode a violation as a cache record:
 * {"line", "character", "severity", "type", "rule_id", "reason"}.
 * Absent line/character are written as null.
 */
[[nodiscard]] nlohmann::json to_cache_record(const Violation& violation);

/**
 * Decode a cache record produced by to_cache_record().
 *
 * Returns std::nullopt when severity, type, rule_id or reason is missing or
 * has the wrong type. A line or character that is not an int-sized integer
 * is read as absent. The location file is taken from @p file, since records
 * are stored under their file key.
 */
[[nodiscard]] std::optional<Violation> violation_from_cache_record(const nlohmann::json& record,
                                                                   std::string_view file);

}  // namespace lintcache::model
