/**
 * @file analysis.cpp
 * @brief Transaction analysis pipeline
 */

#include "sorocost/analysis.hpp"

#include "sorocost/hints.hpp"
#include "sorocost/safety.hpp"

#include <utility>

namespace sorocost::analysis {

Clock system_clock()
{
    return [] { return std::chrono::system_clock::now(); };
}

TransactionAnalyzer::TransactionAnalyzer(Clock clock)
    : m_clock(std::move(clock))
{}

sorocost::Result<Analysis> TransactionAnalyzer::analyze(const simulation::SimulationResult& sim,
                                                        const config::NetworkConfig& cfg) const
{
    if (auto valid = config::validate_config(cfg); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = simulation::validate_simulation(sim); !valid) {
        return std::unexpected(valid.error());
    }

    const auto cpu = cost::compute_cpu_cost(sim.instructions, cfg);
    const auto memory = cost::compute_memory_cost(sim.memory_bytes, cfg);
    const auto ledger = cost::compute_ledger_cost(sim, cfg);

    const auto scores = scoring::compute_scores(cpu, memory, ledger);

    return Analysis{
        .cpu = cpu,
        .memory = memory,
        .ledger = ledger,
        .scores = scores,
        .hints = hints::generate_hints(cpu, memory, ledger),
        .safety_violations = safety::check_safety(cpu, memory, ledger),
        .timestamp = m_clock ? m_clock() : std::chrono::system_clock::now(),
        .config_version = cfg.version,
    };
}

sorocost::Result<Analysis> analyze_transaction(const simulation::SimulationResult& sim,
                                               const config::NetworkConfig& cfg)
{
    return TransactionAnalyzer{}.analyze(sim, cfg);
}

}  // namespace sorocost::analysis
