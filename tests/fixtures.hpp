#pragma once

/**
 * @file fixtures.hpp
 * @brief Simulation result builders shared by the test suites
 */

#include "sorocost/cost_model.hpp"
#include "sorocost/simulation.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sorocost::test {

inline simulation::SimulationResult make_sim(std::int64_t instructions,
                                             std::int64_t memory_bytes,
                                             std::vector<std::string> read_only = {},
                                             std::vector<std::string> read_write = {},
                                             std::int64_t read_bytes = 0,
                                             std::int64_t write_bytes = 0,
                                             std::int64_t tx_size = 0)
{
    simulation::SimulationResult sim;
    sim.instructions = instructions;
    sim.memory_bytes = memory_bytes;
    sim.resources.footprint.read_only = std::move(read_only);
    sim.resources.footprint.read_write = std::move(read_write);
    sim.resources.instructions = instructions;
    sim.resources.read_bytes = read_bytes;
    sim.resources.write_bytes = write_bytes;
    sim.transaction_size_bytes = tx_size;
    return sim;
}

/// Token transfer: 2 reads, 1 write, small payloads
inline simulation::SimulationResult simple_token_transfer()
{
    return make_sim(1'250'000,
                    2'097'152,
                    {"ContractData(token_balance_alice)", "ContractData(token_metadata)"},
                    {"ContractData(token_balance_bob)"},
                    512,
                    256,
                    4096);
}

/// Multi-contract marketplace call: 75% CPU, ~76% memory, 6 reads, 4 writes
inline simulation::SimulationResult complex_marketplace()
{
    return make_sim(75'000'000,
                    32'000'000,
                    {"entry1", "entry2", "entry3", "entry4", "entry5", "entry6"},
                    {"entry7", "entry8", "entry9", "entry10"},
                    45'000,
                    12'000,
                    18'000);
}

/// 96% of the instruction and memory limits, nothing else
inline simulation::SimulationResult near_limit()
{
    return make_sim(96'000'000, 40'265'318);
}

inline cost::LedgerCost uniform_ledger(double utilization, double fee = 0.0005)
{
    cost::LedgerBreakdown breakdown;
    for (auto dim : cost::kLedgerDimensions) {
        breakdown.set(dim, utilization);
    }
    return cost::LedgerCost{.fee = fee, .normalized = utilization, .breakdown = breakdown};
}

inline cost::CpuCost cpu_at(double normalized, double ledger_pressure = 0.0001)
{
    return cost::CpuCost{.fee = 0.001,
                         .normalized = normalized,
                         .ledger_pressure = ledger_pressure,
                         .total = 0.001};
}

inline cost::MemoryCost memory_at(double normalized)
{
    return cost::MemoryCost{.bytes_used = 1'000'000, .normalized = normalized, .cost = 20.0};
}

}  // namespace sorocost::test
