#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation with a per-path cache of compiled schemas
 */

#include "sorocost/common.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace valijson {
class Schema;
}  // namespace valijson

namespace sorocost::common {

/**
 * Compiled schemas keyed by file path.
 *
 * A schema file is read and compiled once; later lookups of the same path
 * return the compiled schema even if the file changed. Schemas must be
 * self-contained (only "#/definitions/..." references). Thread-safe.
 */
class SchemaCache
{
public:
    SchemaCache() = default;
    SchemaCache(const SchemaCache&) = delete;
    SchemaCache& operator=(const SchemaCache&) = delete;

    /**
     * Get the compiled schema for @p schema_path, loading it on first use
     * @return SchemaFileOpenFailed, SchemaParseFailed or SchemaBuildFailed on failure
     */
    [[nodiscard]] sorocost::Result<std::shared_ptr<const valijson::Schema>>
    get(const std::string& schema_path);

    /// Drop every compiled schema
    void clear();

    [[nodiscard]] std::size_t size() const;

    /// Process-wide cache used by validate_json(j, schema_path)
    [[nodiscard]] static SchemaCache& shared();

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<const valijson::Schema>> m_schemas;
};

/**
 * Validate JSON against a compiled schema from @p cache
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @param cache Schema cache to load through
 * @return Empty on success; SchemaValidationFailed lists the first violations
 */
[[nodiscard]] sorocost::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::string& schema_path,
                                                 SchemaCache& cache);

/// validate_json() through SchemaCache::shared()
[[nodiscard]] sorocost::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::string& schema_path);

}  // namespace sorocost::common
