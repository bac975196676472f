#pragma once

/**
 * @file cost_model.hpp
 * @brief CPU, memory and ledger cost models
 *
 * All functions are pure and expect inputs that already passed
 * validate_config() and validate_simulation(). Utilizations are
 * non-negative and may exceed 1.0.
 */

#include "sorocost/config.hpp"
#include "sorocost/simulation.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace sorocost::cost {

/// Weight of ledger pressure in the CPU total
constexpr double kLedgerPressureWeight = 0.5;

/// Memory penalty: kMemoryScalingFactor * e^(kMemoryExponent * utilization)
constexpr double kMemoryScalingFactor = 100.0;
constexpr double kMemoryExponent = 5.0;

/// Billing granularity for byte volumes
constexpr std::int64_t kBytesPerKilobyte = 1024;

/**
 * Ledger utilization dimensions, in reporting order.
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class LedgerDimension : std::uint8_t {
    kReadEntries,
    kReadBytes,
    kWriteEntries,
    kWriteBytes,
    kBandwidth,
};

constexpr std::size_t kLedgerDimensionCount = 5;

constexpr std::array<LedgerDimension, kLedgerDimensionCount> kLedgerDimensions{
    LedgerDimension::kReadEntries,
    LedgerDimension::kReadBytes,
    LedgerDimension::kWriteEntries,
    LedgerDimension::kWriteBytes,
    LedgerDimension::kBandwidth,
};

/// Equal weights for the composite ledger utilization
constexpr std::array<double, kLedgerDimensionCount> kLedgerWeights{0.2, 0.2, 0.2, 0.2, 0.2};

/// Machine name, e.g. "read_entries"
[[nodiscard]] std::string_view dimension_name(LedgerDimension dim);

/// Human-readable label, e.g. "read entry count"
[[nodiscard]] std::string_view dimension_label(LedgerDimension dim);

/**
 * Per-dimension utilization table indexed by LedgerDimension.
 * Iteration follows kLedgerDimensions.
 */
class LedgerBreakdown
{
public:
    LedgerBreakdown() = default;

    [[nodiscard]] double at(LedgerDimension dim) const
    {
        return m_values[std::to_underlying(dim)];
    }

    void set(LedgerDimension dim, double utilization)
    {
        m_values[std::to_underlying(dim)] = utilization;
    }

    /// Ordered (dimension, utilization) pairs
    [[nodiscard]] std::array<std::pair<LedgerDimension, double>, kLedgerDimensionCount>
    entries() const;

    bool operator==(const LedgerBreakdown&) const = default;

private:
    std::array<double, kLedgerDimensionCount> m_values{};
};

struct CpuCost
{
    double fee;              ///< XLM
    double normalized;       ///< instructions / txMaxInstructions
    double ledger_pressure;  ///< (instructions / ledgerMaxInstructions)^2
    double total;            ///< fee * (1 + 0.5 * ledger_pressure)

    bool operator==(const CpuCost&) const = default;
};

struct MemoryCost
{
    std::int64_t bytes_used;
    double normalized;  ///< memoryBytes / txMemoryLimit
    double cost;        ///< advisory penalty score, not a fee; saturates at DBL_MAX

    bool operator==(const MemoryCost&) const = default;
};

struct LedgerCost
{
    double fee;         ///< XLM
    double normalized;  ///< weighted composite of the breakdown
    LedgerBreakdown breakdown;

    bool operator==(const LedgerCost&) const = default;
};

/**
 * Bytes to billable kilobytes, rounding any partial kilobyte up
 */
[[nodiscard]] constexpr std::int64_t billable_kilobytes(std::int64_t bytes) noexcept
{
    if (bytes <= 0) {
        return 0;
    }
    return bytes / kBytesPerKilobyte + (bytes % kBytesPerKilobyte != 0 ? 1 : 0);
}

[[nodiscard]] CpuCost compute_cpu_cost(std::int64_t instructions,
                                       const config::NetworkConfig& cfg);

[[nodiscard]] MemoryCost compute_memory_cost(std::int64_t memory_bytes,
                                             const config::NetworkConfig& cfg);

[[nodiscard]] LedgerCost compute_ledger_cost(const simulation::SimulationResult& sim,
                                             const config::NetworkConfig& cfg);

}  // namespace sorocost::cost
