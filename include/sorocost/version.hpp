#pragma once

/**
 * @file version.hpp
 * @brief sorocost version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace sorocost {

/// sorocost version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Cost model revision (embedded in all reports)
constexpr const char* kCostModelVersion = "cost-model.v1";

/// Report document schema
constexpr const char* kAnalysisSchemaVersion = "analysis.v1";

}  // namespace sorocost
