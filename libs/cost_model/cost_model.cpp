/**
 * @file cost_model.cpp
 * @brief CPU, memory and ledger cost computation
 */

#include "sorocost/cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sorocost::cost {

namespace {

[[nodiscard]] double ratio(std::int64_t used, std::int64_t limit)
{
    return static_cast<double>(used) / static_cast<double>(limit);
}

[[nodiscard]] std::int64_t ceil_div(std::int64_t value, std::int64_t divisor)
{
    if (value <= 0) {
        return 0;
    }
    return value / divisor + (value % divisor != 0 ? 1 : 0);
}

}  // namespace

std::string_view dimension_name(LedgerDimension dim)
{
    switch (dim) {
        case LedgerDimension::kReadEntries:
            return "read_entries";
        case LedgerDimension::kReadBytes:
            return "read_bytes";
        case LedgerDimension::kWriteEntries:
            return "write_entries";
        case LedgerDimension::kWriteBytes:
            return "write_bytes";
        case LedgerDimension::kBandwidth:
            return "bandwidth";
    }
    return "unknown";
}

std::string_view dimension_label(LedgerDimension dim)
{
    switch (dim) {
        case LedgerDimension::kReadEntries:
            return "read entry count";
        case LedgerDimension::kReadBytes:
            return "read byte volume";
        case LedgerDimension::kWriteEntries:
            return "write entry count";
        case LedgerDimension::kWriteBytes:
            return "write byte volume";
        case LedgerDimension::kBandwidth:
            return "transaction size";
    }
    return "unknown dimension";
}

std::array<std::pair<LedgerDimension, double>, kLedgerDimensionCount>
LedgerBreakdown::entries() const
{
    std::array<std::pair<LedgerDimension, double>, kLedgerDimensionCount> out{};
    for (std::size_t i = 0; i < kLedgerDimensionCount; ++i) {
        out[i] = {kLedgerDimensions[i], at(kLedgerDimensions[i])};
    }
    return out;
}

CpuCost compute_cpu_cost(std::int64_t instructions, const config::NetworkConfig& cfg)
{
    const std::int64_t increments = ceil_div(instructions, cfg.fee_rate_per_instructions_increment);
    const double fee = static_cast<double>(increments) * cfg.fee_cpu_per_increment;

    const double util_tx = ratio(instructions, cfg.tx_max_instructions);
    const double util_ledger = ratio(instructions, cfg.ledger_max_instructions);
    // Quadratic: a transaction taking a large share of the ledger budget pays disproportionately.
    const double ledger_pressure = util_ledger * util_ledger;

    return CpuCost{
        .fee = fee,
        .normalized = util_tx,
        .ledger_pressure = ledger_pressure,
        .total = fee * (1.0 + kLedgerPressureWeight * ledger_pressure),
    };
}

MemoryCost compute_memory_cost(std::int64_t memory_bytes, const config::NetworkConfig& cfg)
{
    const double utilization = ratio(memory_bytes, cfg.tx_memory_limit);
    // Saturates at DBL_MAX; exp() overflows past roughly 142x the limit.
    const double penalty = std::min(kMemoryScalingFactor * std::exp(kMemoryExponent * utilization),
                                    std::numeric_limits<double>::max());
    return MemoryCost{
        .bytes_used = memory_bytes,
        .normalized = utilization,
        .cost = penalty,
    };
}

LedgerCost compute_ledger_cost(const simulation::SimulationResult& sim,
                               const config::NetworkConfig& cfg)
{
    const auto& resources = sim.resources;
    const auto reads = static_cast<std::int64_t>(resources.footprint.read_only.size());
    const auto writes = static_cast<std::int64_t>(resources.footprint.read_write.size());

    const double cost_reads =
        static_cast<double>(reads) * cfg.fee_read_ledger_entry
        + static_cast<double>(billable_kilobytes(resources.read_bytes)) * cfg.fee_read_1kb;
    const double cost_writes =
        static_cast<double>(writes) * cfg.fee_write_ledger_entry
        + static_cast<double>(billable_kilobytes(resources.write_bytes)) * cfg.fee_write_1kb;
    const double cost_bandwidth =
        static_cast<double>(billable_kilobytes(sim.transaction_size_bytes)) * cfg.fee_tx_size_1kb;

    LedgerBreakdown breakdown;
    breakdown.set(LedgerDimension::kReadEntries, ratio(reads, cfg.tx_max_read_ledger_entries));
    breakdown.set(LedgerDimension::kReadBytes, ratio(resources.read_bytes, cfg.tx_max_read_bytes));
    breakdown.set(LedgerDimension::kWriteEntries, ratio(writes, cfg.tx_max_write_ledger_entries));
    breakdown.set(LedgerDimension::kWriteBytes,
                  ratio(resources.write_bytes, cfg.tx_max_write_bytes));
    breakdown.set(LedgerDimension::kBandwidth,
                  ratio(sim.transaction_size_bytes, cfg.tx_max_size_bytes));

    double composite = 0.0;
    for (std::size_t i = 0; i < kLedgerDimensionCount; ++i) {
        composite += breakdown.at(kLedgerDimensions[i]) * kLedgerWeights[i];
    }

    return LedgerCost{
        .fee = cost_reads + cost_writes + cost_bandwidth,
        .normalized = composite,
        .breakdown = breakdown,
    };
}

}  // namespace sorocost::cost
