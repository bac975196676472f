#pragma once

/**
 * @file analysis.hpp
 * @brief Transaction analysis pipeline: costs -> scores -> hints and safety
 */

#include "sorocost/common.hpp"
#include "sorocost/config.hpp"
#include "sorocost/cost_model.hpp"
#include "sorocost/scoring.hpp"
#include "sorocost/simulation.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sorocost::analysis {

/// Wall-clock source for Analysis::timestamp
using Clock = std::function<std::chrono::system_clock::time_point()>;

[[nodiscard]] Clock system_clock();

struct Analysis
{
    cost::CpuCost cpu;
    cost::MemoryCost memory;
    cost::LedgerCost ledger;
    scoring::Scores scores;
    std::vector<std::string> hints;
    std::vector<std::string> safety_violations;
    std::chrono::system_clock::time_point timestamp;  ///< informational only
    std::string config_version;

    /// Billed CPU fee plus ledger fee, in XLM
    [[nodiscard]] double total_fee() const { return cpu.fee + ledger.fee; }

    [[nodiscard]] bool has_violations() const { return !safety_violations.empty(); }
};

class TransactionAnalyzer
{
public:
    explicit TransactionAnalyzer(Clock clock = system_clock());

    /**
     * Run the full pipeline.
     * @return Analysis, or ConfigurationError / InvalidInputError when an
     *         input is rejected before any cost is computed
     */
    [[nodiscard]] sorocost::Result<Analysis> analyze(const simulation::SimulationResult& sim,
                                                     const config::NetworkConfig& cfg) const;

private:
    Clock m_clock;
};

/**
 * Convenience wrapper using the system clock
 */
[[nodiscard]] sorocost::Result<Analysis>
analyze_transaction(const simulation::SimulationResult& sim, const config::NetworkConfig& cfg);

}  // namespace sorocost::analysis
