/**
 * @file config.cpp
 * @brief Network configuration defaults, validation and JSON mapping
 */

#include "sorocost/config.hpp"

#include "sorocost/json_io.hpp"
#include "sorocost/schema_validate.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <string_view>

namespace sorocost::config {

namespace {

struct IntField
{
    std::string_view name;
    std::int64_t NetworkConfig::*member;
};

struct RateField
{
    std::string_view name;
    double NetworkConfig::*member;
};

// JSON names follow the network's own config setting names.
constexpr std::array<IntField, 14> kIntFields{{
    {"txMaxInstructions", &NetworkConfig::tx_max_instructions},
    {"ledgerMaxInstructions", &NetworkConfig::ledger_max_instructions},
    {"feeRatePerInstructionsIncrement", &NetworkConfig::fee_rate_per_instructions_increment},
    {"txMemoryLimit", &NetworkConfig::tx_memory_limit},
    {"txMaxReadLedgerEntries", &NetworkConfig::tx_max_read_ledger_entries},
    {"txMaxReadBytes", &NetworkConfig::tx_max_read_bytes},
    {"txMaxWriteLedgerEntries", &NetworkConfig::tx_max_write_ledger_entries},
    {"txMaxWriteBytes", &NetworkConfig::tx_max_write_bytes},
    {"ledgerMaxReadLedgerEntries", &NetworkConfig::ledger_max_read_ledger_entries},
    {"ledgerMaxReadBytes", &NetworkConfig::ledger_max_read_bytes},
    {"ledgerMaxWriteLedgerEntries", &NetworkConfig::ledger_max_write_ledger_entries},
    {"ledgerMaxWriteBytes", &NetworkConfig::ledger_max_write_bytes},
    {"txMaxSizeBytes", &NetworkConfig::tx_max_size_bytes},
    {"ledgerMaxTxsSizeBytes", &NetworkConfig::ledger_max_txs_size_bytes},
}};

constexpr std::array<RateField, 6> kRateFields{{
    {"feeCPUPerIncrement", &NetworkConfig::fee_cpu_per_increment},
    {"feeReadLedgerEntry", &NetworkConfig::fee_read_ledger_entry},
    {"feeWriteLedgerEntry", &NetworkConfig::fee_write_ledger_entry},
    {"feeRead1KB", &NetworkConfig::fee_read_1kb},
    {"feeWrite1KB", &NetworkConfig::fee_write_1kb},
    {"feeTxSize1KB", &NetworkConfig::fee_tx_size_1kb},
}};

[[nodiscard]] sorocost::Error config_error(std::string_view field, std::string_view detail)
{
    return sorocost::Error::make(kConfigurationError,
                                 "Configuration field '" + std::string(field) + "' "
                                     + std::string(detail));
}

[[nodiscard]] sorocost::Error type_error(std::string_view field, std::string_view expected)
{
    return sorocost::Error::make(kConfigurationError,
                                 "Configuration field '" + std::string(field) + "' must be "
                                     + std::string(expected));
}

[[nodiscard]] sorocost::Result<std::int64_t> read_int(const nlohmann::json& value,
                                                      std::string_view field)
{
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::unexpected(type_error(field, "a 64-bit signed integer"));
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    return std::unexpected(type_error(field, "an integer"));
}

}  // namespace

NetworkConfig default_config()
{
    return NetworkConfig{};
}

sorocost::VoidResult validate_config(const NetworkConfig& cfg)
{
    for (const auto& field : kIntFields) {
        if (cfg.*field.member <= 0) {
            return std::unexpected(config_error(field.name, "must be greater than zero"));
        }
    }
    for (const auto& field : kRateFields) {
        const double value = cfg.*field.member;
        if (!std::isfinite(value)) {
            return std::unexpected(config_error(field.name, "must be finite"));
        }
        if (value <= 0.0) {
            return std::unexpected(config_error(field.name, "must be greater than zero"));
        }
    }
    return {};
}

sorocost::Result<NetworkConfig> config_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(
            sorocost::Error::make(kConfigurationError, "Configuration must be a JSON object"));
    }

    NetworkConfig cfg = default_config();
    for (const auto& field : kIntFields) {
        const auto it = j.find(std::string(field.name));
        if (it == j.end()) {
            continue;
        }
        auto value = read_int(*it, field.name);
        if (!value) {
            return std::unexpected(value.error());
        }
        cfg.*field.member = *value;
    }
    for (const auto& field : kRateFields) {
        const auto it = j.find(std::string(field.name));
        if (it == j.end()) {
            continue;
        }
        if (!it->is_number()) {
            return std::unexpected(type_error(field.name, "a number"));
        }
        cfg.*field.member = it->get<double>();
    }
    if (const auto it = j.find("version"); it != j.end()) {
        if (!it->is_string()) {
            return std::unexpected(type_error("version", "a string"));
        }
        cfg.version = it->get<std::string>();
    }

    if (auto valid = validate_config(cfg); !valid) {
        return std::unexpected(valid.error());
    }
    return cfg;
}

nlohmann::json config_to_json(const NetworkConfig& cfg)
{
    nlohmann::json j = nlohmann::json::object();
    j["version"] = cfg.version;
    for (const auto& field : kIntFields) {
        j[std::string(field.name)] = cfg.*field.member;
    }
    for (const auto& field : kRateFields) {
        j[std::string(field.name)] = cfg.*field.member;
    }
    return j;
}

sorocost::Result<NetworkConfig> load_config(const std::filesystem::path& path,
                                            const std::string& schema_dir)
{
    auto payload = sorocost::common::read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    const std::filesystem::path schema_path =
        std::filesystem::path(schema_dir) / "network_config.v1.schema.json";
    if (auto validation = sorocost::common::validate_json(*payload, schema_path.string());
        !validation) {
        return std::unexpected(
            sorocost::Error::make(validation.error().code,
                                  "network_config schema validation failed: "
                                      + validation.error().message));
    }
    return config_from_json(*payload);
}

}  // namespace sorocost::config
