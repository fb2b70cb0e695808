/**
 * @file schema_validate.cpp
 * @brief valijson-backed validation of config and report documents
 *
 * Parsed schemas are kept for the life of the process, keyed by path, since
 * batch analysis validates every report against the same file.
 */

#include "stylint/schema_validate.hpp"

#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace stylint::common {

namespace {

constexpr std::size_t kMaxReportedViolations = 8;

class SchemaCache
{
public:
    [[nodiscard]] Result<const valijson::Schema*> get(const std::string& path)
    {
        const std::scoped_lock lock(m_mutex);
        if (auto it = m_schemas.find(path); it != m_schemas.end()) {
            return it->second.get();
        }
        auto compiled = compile(path);
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        const auto* schema = compiled->get();
        m_schemas.emplace(path, std::move(*compiled));
        return schema;
    }

private:
    [[nodiscard]] static Result<std::unique_ptr<valijson::Schema>> compile(const std::string& path)
    {
        std::ifstream in(path);
        if (!in) {
            return std::unexpected(Error::make("SchemaFileOpenFailed", std::format("cannot open schema {}", path)));
        }
        nlohmann::json document;
        try {
            in >> document;
        } catch (const nlohmann::json::exception& ex) {
            return std::unexpected(Error::make("SchemaParseFailed", std::format("schema {} is not JSON: {}", path, ex.what())));
        }

        auto schema = std::make_unique<valijson::Schema>();
        try {
            valijson::SchemaParser parser;
            const valijson::adapters::NlohmannJsonAdapter adapter(document);
            parser.populateSchema(adapter, *schema);
        } catch (const std::exception& ex) {
            return std::unexpected(Error::make("SchemaBuildFailed", std::format("schema {}: {}", path, ex.what())));
        }
        return schema;
    }

    std::mutex m_mutex;
    std::map<std::string, std::unique_ptr<valijson::Schema>> m_schemas;
};

SchemaCache& schema_cache()
{
    static SchemaCache cache;
    return cache;
}

/// "/findings/0/severity: Failed to match ..." lines joined with "; ".
std::string describe(valijson::ValidationResults& results)
{
    std::string text;
    std::size_t shown = 0;
    std::size_t total = 0;
    valijson::ValidationResults::Error violation;
    while (results.popError(violation)) {
        ++total;
        if (shown == kMaxReportedViolations) {
            continue;
        }
        std::string pointer;
        for (const auto& part : violation.context) {
            // valijson prefixes every context with "<root>"
            if (part != "<root>") {
                pointer += "/" + part;
            }
        }
        if (!text.empty()) {
            text += "; ";
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, violation.description);
        ++shown;
    }
    if (total > shown) {
        text += std::format("; ... {} more", total - shown);
    }
    return text.empty() ? std::string("document does not match schema") : text;
}

}  // namespace

stylint::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema = schema_cache().get(schema_path);
    if (!schema) {
        return std::unexpected(schema.error());
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    const valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(**schema, target, &results)) {
        return std::unexpected(Error::make(std::string(error_code::kSchemaValidationFailed), describe(results)));
    }
    return {};
}

stylint::VoidResult validate_json_in(const nlohmann::json& j, std::string_view schema_dir, std::string_view schema_name)
{
    const auto path = std::filesystem::path(schema_dir) / std::format("{}.schema.json", schema_name);
    return validate_json(j, path.string());
}

}  // namespace stylint::common
