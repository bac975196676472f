/**
 * @file scoring.cpp
 * @brief Three-band piecewise-linear efficiency scoring
 */

#include "sorocost/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace sorocost::scoring {

namespace {

[[nodiscard]] double interpolate(double value,
                                 double in_min,
                                 double in_max,
                                 double out_min,
                                 double out_max)
{
    if (in_max == in_min) {
        return out_min;
    }
    const double ratio = (value - in_min) / (in_max - in_min);
    return out_min + ratio * (out_max - out_min);
}

}  // namespace

int score_dimension(double utilization)
{
    double score = 0.0;
    if (utilization < kGoodThreshold) {
        score = interpolate(utilization, 0.0, kGoodThreshold, kMaxScore, kExcellentFloorScore);
    } else if (utilization < kPoorThreshold) {
        score = interpolate(utilization,
                            kGoodThreshold,
                            kPoorThreshold,
                            kExcellentFloorScore,
                            kGoodFloorScore);
    } else {
        score = interpolate(utilization,
                            kPoorThreshold,
                            kExhaustedUtilization,
                            kGoodFloorScore,
                            kMinScore);
    }
    score = std::clamp(score, static_cast<double>(kMinScore), static_cast<double>(kMaxScore));
    return static_cast<int>(std::floor(score));
}

Scores compute_scores(const cost::CpuCost& cpu,
                      const cost::MemoryCost& memory,
                      const cost::LedgerCost& ledger)
{
    const int cpu_score = score_dimension(cpu.normalized);
    const int memory_score = score_dimension(memory.normalized);
    const int ledger_score = score_dimension(ledger.normalized);

    const double weighted = kCpuWeight * cpu_score + kMemoryWeight * memory_score
                            + kLedgerWeight * ledger_score;

    return Scores{
        .cpu = cpu_score,
        .memory = memory_score,
        .ledger = ledger_score,
        .total = static_cast<int>(std::floor(weighted)),
    };
}

}  // namespace sorocost::scoring
