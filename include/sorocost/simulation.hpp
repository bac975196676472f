#pragma once

/**
 * @file simulation.hpp
 * @brief Transaction simulation result consumed by the cost pipeline
 *
 * Values are produced by a transaction-simulation collaborator (an RPC
 * simulateTransaction call) and never mutated by the pipeline. Counters are
 * signed so that malformed negative input can be represented and rejected.
 */

#include "sorocost/common.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sorocost::simulation {

/// Declared ledger keys. Entry counts are list lengths; duplicates count.
struct Footprint
{
    std::vector<std::string> read_only;
    std::vector<std::string> read_write;
};

struct SorobanResources
{
    Footprint footprint;
    std::int64_t instructions = 0;
    std::int64_t read_bytes = 0;
    std::int64_t write_bytes = 0;
};

struct SimulationResult
{
    std::int64_t instructions = 0;
    std::int64_t memory_bytes = 0;
    SorobanResources resources;
    std::int64_t transaction_size_bytes = 0;
};

/**
 * Reject negative counters. Footprint identifiers are opaque and any string counts
 * @return Empty on success, InvalidInputError otherwise
 */
[[nodiscard]] sorocost::VoidResult validate_simulation(const SimulationResult& sim);

/**
 * Parse the camelCase simulateTransaction shape.
 * Null or non-string footprint entries are rejected.
 */
[[nodiscard]] sorocost::Result<SimulationResult> simulation_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json simulation_to_json(const SimulationResult& sim);

/**
 * Read, schema-check and parse a simulation result file
 * @param path JSON file
 * @param schema_dir Directory holding simulation.v1.schema.json
 */
[[nodiscard]] sorocost::Result<SimulationResult>
load_simulation(const std::filesystem::path& path, const std::string& schema_dir);

}  // namespace sorocost::simulation
