/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "sorocost/schema_validate.hpp"

#include "sorocost/json_io.hpp"

#include <exception>
#include <format>
#include <utility>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace sorocost::common {

namespace {

/// Violations listed in a SchemaValidationFailed message; the rest are counted
constexpr std::size_t kMaxReportedViolations = 5;

[[nodiscard]] sorocost::Result<std::shared_ptr<const valijson::Schema>>
compile_schema(const std::string& schema_path)
{
    auto document = read_json_file(schema_path);
    if (!document) {
        if (document.error().code == kIOError) {
            return std::unexpected(Error::make(
                "SchemaFileOpenFailed", std::format("Failed to open schema file: {}", schema_path)));
        }
        return std::unexpected(
            Error::make("SchemaParseFailed",
                        std::format("Failed to parse schema {}: {}",
                                    schema_path,
                                    document.error().message)));
    }

    auto schema = std::make_shared<valijson::Schema>();
    try {
        valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
        valijson::adapters::NlohmannJsonAdapter adapter(*document);
        parser.populateSchema(adapter, *schema);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaBuildFailed", std::format("Failed to build schema {}: {}", schema_path, ex.what())));
    }
    return std::shared_ptr<const valijson::Schema>(std::move(schema));
}

/// "<root>[resources][readBytes]: Value ..." joined with "; "
[[nodiscard]] std::string describe_violations(valijson::ValidationResults& results)
{
    std::vector<std::string> lines;
    std::size_t total = 0;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        ++total;
        if (lines.size() == kMaxReportedViolations) {
            continue;
        }
        std::string where;
        for (const auto& part : error.context) {
            where += part;
        }
        lines.push_back(std::format("{}: {}", where.empty() ? "<root>" : where, error.description));
    }

    std::string message;
    for (const auto& line : lines) {
        if (!message.empty()) {
            message += "; ";
        }
        message += line;
    }
    if (total > lines.size()) {
        message += std::format(" (and {} more)", total - lines.size());
    }
    return message;
}

}  // namespace

sorocost::Result<std::shared_ptr<const valijson::Schema>>
SchemaCache::get(const std::string& schema_path)
{
    std::lock_guard lock(m_mutex);
    if (auto it = m_schemas.find(schema_path); it != m_schemas.end()) {
        return it->second;
    }
    auto compiled = compile_schema(schema_path);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    m_schemas.emplace(schema_path, *compiled);
    return *compiled;
}

void SchemaCache::clear()
{
    std::lock_guard lock(m_mutex);
    m_schemas.clear();
}

std::size_t SchemaCache::size() const
{
    std::lock_guard lock(m_mutex);
    return m_schemas.size();
}

SchemaCache& SchemaCache::shared()
{
    static SchemaCache cache;
    return cache;
}

sorocost::VoidResult validate_json(const nlohmann::json& j,
                                   const std::string& schema_path,
                                   SchemaCache& cache)
{
    auto schema = cache.get(schema_path);
    if (!schema) {
        return std::unexpected(schema.error());
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (validator.validate(**schema, target, &results)) {
        return {};
    }

    std::string message = describe_violations(results);
    if (message.empty()) {
        message = std::format("Document does not match {}", schema_path);
    }
    return std::unexpected(Error::make("SchemaValidationFailed", std::move(message)));
}

sorocost::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    return validate_json(j, schema_path, SchemaCache::shared());
}

}  // namespace sorocost::common
