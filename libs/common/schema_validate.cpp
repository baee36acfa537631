/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "lintcache/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace lintcache::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "lintcache:schema/";

[[nodiscard]] lintcache::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make("SchemaParseFailed",
                        std::format("Failed to parse schema {}: {}", path.string(), ex.what())));
    }
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }

        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context, error.description);
    }

    return result;
}

}  // namespace

lintcache::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = read_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> owned_schemas;
    const auto fetch_doc = [&schema_dir,
                            &owned_schemas](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto name = uri.substr(kSchemaUriPrefix.size());
        auto fetched = read_schema(schema_dir / (name + ".schema.json"));
        if (!fetched) {
            return nullptr;
        }
        owned_schemas.push_back(std::make_unique<nlohmann::json>(std::move(*fetched)));
        return owned_schemas.back().get();
    };
    const auto free_doc = [](const nlohmann::json* schema_ptr) { (void)schema_ptr; };

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }

    return {};
}

}  // namespace lintcache::common
