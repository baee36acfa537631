/**
 * @file violation.cpp
 * @brief Cache record encoding for lint findings
 */

#include "lintcache/violation.hpp"

#include <cstdint>
#include <limits>

namespace lintcache::model {

namespace {

[[nodiscard]] std::optional<std::string> string_field(const nlohmann::json& record,
                                                      const char* key)
{
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] std::optional<int> int_field(const nlohmann::json& record, const char* key)
{
    auto it = record.find(key);
    if (it == record.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        auto value = it->get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    return std::nullopt;
}

[[nodiscard]] nlohmann::json nullable(const std::optional<int>& value)
{
    if (value) {
        return *value;
    }
    return nullptr;
}

}  // namespace

std::string_view to_string(Severity severity)
{
    switch (severity) {
        case Severity::kWarning:
            return "warning";
        case Severity::kError:
            return "error";
    }
    return "warning";
}

std::optional<Severity> severity_from_string(std::string_view value)
{
    if (value == "warning") {
        return Severity::kWarning;
    }
    if (value == "error") {
        return Severity::kError;
    }
    return std::nullopt;
}

nlohmann::json to_cache_record(const Violation& violation)
{
    return nlohmann::json{
        {     "line",      nullable(violation.location.line)},
        {"character", nullable(violation.location.character)},
        { "severity",       to_string(violation.severity)},
        {     "type",                 violation.rule_name},
        {  "rule_id",                   violation.rule_id},
        {   "reason",                    violation.reason}
    };
}

std::optional<Violation> violation_from_cache_record(const nlohmann::json& record,
                                                     std::string_view file)
{
    if (!record.is_object()) {
        return std::nullopt;
    }

    auto severity_name = string_field(record, "severity");
    auto severity = severity_name ? severity_from_string(*severity_name) : std::nullopt;
    auto rule_name = string_field(record, "type");
    auto rule_id = string_field(record, "rule_id");
    auto reason = string_field(record, "reason");
    if (!severity || !rule_name || !rule_id || !reason) {
        return std::nullopt;
    }

    return Violation{
        .rule_id = std::move(*rule_id),
        .rule_name = std::move(*rule_name),
        .severity = *severity,
        .location = Location{.file = std::string(file),
                             .line = int_field(record, "line"),
                             .character = int_field(record, "character")},
        .reason = std::move(*reason),
    };
}

}  // namespace lintcache::model
