#pragma once

/**
 * @file config.hpp
 * @brief Soroban network resource limits and fee rates
 *
 * A NetworkConfig is an immutable value supplied by the caller. All numeric
 * fields must be strictly positive; validate_config() enforces this before
 * any cost model divides by a limit.
 */

#include "sorocost/common.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace sorocost::config {

struct NetworkConfig
{
    // CPU / compute
    std::int64_t tx_max_instructions = 100'000'000;
    std::int64_t ledger_max_instructions = 1'000'000'000;
    std::int64_t fee_rate_per_instructions_increment = 10'000;
    double fee_cpu_per_increment = 0.00001;  ///< XLM
    std::int64_t tx_memory_limit = 41'943'040;  ///< bytes

    // Ledger I/O limits
    std::int64_t tx_max_read_ledger_entries = 40;
    std::int64_t tx_max_read_bytes = 200'000;
    std::int64_t tx_max_write_ledger_entries = 25;
    std::int64_t tx_max_write_bytes = 100'000;
    std::int64_t ledger_max_read_ledger_entries = 20'000;
    std::int64_t ledger_max_read_bytes = 100'000'000;
    std::int64_t ledger_max_write_ledger_entries = 10'000;
    std::int64_t ledger_max_write_bytes = 50'000'000;

    // Ledger I/O fees (XLM)
    double fee_read_ledger_entry = 0.0001;
    double fee_write_ledger_entry = 0.0002;
    double fee_read_1kb = 0.00005;
    double fee_write_1kb = 0.0001;

    // Bandwidth
    std::int64_t tx_max_size_bytes = 100'000;
    std::int64_t ledger_max_txs_size_bytes = 1'000'000;
    double fee_tx_size_1kb = 0.00001;  ///< XLM

    std::string version = "mainnet-v20";

    bool operator==(const NetworkConfig&) const = default;
};

/**
 * Default mainnet (protocol 20) configuration
 */
[[nodiscard]] NetworkConfig default_config();

/**
 * Check that every limit and fee rate is strictly positive and finite
 * @return Empty on success, ConfigurationError naming the first bad field
 */
[[nodiscard]] sorocost::VoidResult validate_config(const NetworkConfig& cfg);

/**
 * Build a configuration from a JSON object using camelCase field names.
 * Fields absent from the object keep their default value.
 */
[[nodiscard]] sorocost::Result<NetworkConfig> config_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json config_to_json(const NetworkConfig& cfg);

/**
 * Read, schema-check and parse a configuration file
 * @param path JSON file
 * @param schema_dir Directory holding network_config.v1.schema.json
 */
[[nodiscard]] sorocost::Result<NetworkConfig> load_config(const std::filesystem::path& path,
                                                          const std::string& schema_dir);

}  // namespace sorocost::config
