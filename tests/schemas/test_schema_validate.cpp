#include "fixtures.hpp"
#include "sorocost/analysis.hpp"
#include "sorocost/config.hpp"
#include "sorocost/report.hpp"
#include "sorocost/schema_validate.hpp"
#include "sorocost/simulation.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace sorocost::common::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(SOROCOST_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_analysis_json()
{
    auto analysis = sorocost::analysis::analyze_transaction(
        sorocost::test::complex_marketplace(), sorocost::config::default_config());
    EXPECT_TRUE(analysis.has_value());
    return sorocost::report::analysis_to_json(*analysis);
}

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

void write_text(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
}

}  // namespace

TEST(SchemaValidate, AnalysisReportIsValid)
{
    auto result = validate_json(make_analysis_json(), schema_path("analysis.v1.schema.json"));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidate, AnalysisReportWithSaturatedMemoryPenaltyIsValid)
{
    auto analysis = sorocost::analysis::analyze_transaction(
        sorocost::test::make_sim(1'000, 1'000'000'000'000), sorocost::config::default_config());
    ASSERT_TRUE(analysis.has_value()) << analysis.error().message;
    const auto j = sorocost::report::analysis_to_json(*analysis);
    EXPECT_TRUE(j.at("costs").at("memory").at("cost").is_number_float());

    auto result = validate_json(j, schema_path("analysis.v1.schema.json"));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidate, AnalysisReportRejectsOutOfRangeScore)
{
    auto j = make_analysis_json();
    j["scores"]["total"] = 101;
    auto result = validate_json(j, schema_path("analysis.v1.schema.json"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, AnalysisReportRejectsUnknownDimension)
{
    auto j = make_analysis_json();
    j["costs"]["ledger"]["breakdown"][0]["dimension"] = "gas";
    EXPECT_FALSE(validate_json(j, schema_path("analysis.v1.schema.json")).has_value());
}

TEST(SchemaValidate, SimulationSchema)
{
    auto valid = sorocost::simulation::simulation_to_json(sorocost::test::simple_token_transfer());
    auto result = validate_json(valid, schema_path("simulation.v1.schema.json"));
    EXPECT_TRUE(result.has_value()) << result.error().message;

    auto null_entry = valid;
    null_entry["resources"]["footprint"]["readOnly"][0] = nullptr;
    EXPECT_FALSE(validate_json(null_entry, schema_path("simulation.v1.schema.json")).has_value());

    auto missing = valid;
    missing.erase("transactionSizeBytes");
    EXPECT_FALSE(validate_json(missing, schema_path("simulation.v1.schema.json")).has_value());
}

TEST(SchemaValidate, NetworkConfigSchema)
{
    auto valid = sorocost::config::config_to_json(sorocost::config::default_config());
    auto result = validate_json(valid, schema_path("network_config.v1.schema.json"));
    EXPECT_TRUE(result.has_value()) << result.error().message;

    auto negative_rate = valid;
    negative_rate["feeWrite1KB"] = -0.1;
    EXPECT_FALSE(
        validate_json(negative_rate, schema_path("network_config.v1.schema.json")).has_value());
}

TEST(SchemaValidate, MissingSchemaFile)
{
    auto result = validate_json(nlohmann::json::object(), schema_path("absent.v1.schema.json"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(SchemaValidate, ReportsViolationLocation)
{
    auto j = make_analysis_json();
    j["scores"]["cpu"] = -3;
    auto result = validate_json(j, schema_path("analysis.v1.schema.json"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
    EXPECT_NE(result.error().message.find("[scores]"), std::string::npos)
        << result.error().message;
}

TEST(SchemaCache, CompilesEachPathOnce)
{
    auto dir = ensure_temp_dir("sorocost_schema_cache");
    const auto path = (dir / "counter.schema.json").string();
    write_text(path, R"({"type": "integer"})");

    SchemaCache cache;
    EXPECT_TRUE(validate_json(nlohmann::json(7), path, cache).has_value());
    EXPECT_EQ(cache.size(), 1U);

    // A changed file is not re-read until the cache is cleared.
    write_text(path, R"({"type": "string"})");
    EXPECT_TRUE(validate_json(nlohmann::json(7), path, cache).has_value());
    EXPECT_EQ(cache.size(), 1U);

    cache.clear();
    EXPECT_EQ(cache.size(), 0U);
    auto reloaded = validate_json(nlohmann::json(7), path, cache);
    ASSERT_FALSE(reloaded.has_value());
    EXPECT_EQ(reloaded.error().code, "SchemaValidationFailed");
}

TEST(SchemaCache, FailedLoadsAreNotCached)
{
    auto dir = ensure_temp_dir("sorocost_schema_cache_failure");
    const auto path = (dir / "broken.schema.json").string();
    write_text(path, "{ not json");

    SchemaCache cache;
    auto broken = cache.get(path);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().code, "SchemaParseFailed");
    EXPECT_EQ(cache.size(), 0U);

    write_text(path, R"({"type": "object"})");
    EXPECT_TRUE(cache.get(path).has_value());
    EXPECT_EQ(cache.size(), 1U);
}

TEST(SchemaCache, ExternalReferencesAreRejected)
{
    auto dir = ensure_temp_dir("sorocost_schema_cache_ref");
    const auto path = (dir / "external.schema.json").string();
    write_text(path, R"({"$ref": "other.schema.json#/definitions/x"})");

    SchemaCache cache;
    auto result = cache.get(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaBuildFailed");
}

}  // namespace sorocost::common::test
