#pragma once

/**
 * @file scoring.hpp
 * @brief Utilization to 0-100 efficiency score mapping
 *
 * Bands (piecewise linear, floored, clamped to [0, 100]):
 * - Excellent: utilization [0, 0.5)   -> score [100, 80]
 * - Good:      utilization [0.5, 0.8) -> score [80, 50]
 * - Poor:      utilization [0.8, inf) -> score [50, 0], reaching 0 at 1.0
 */

#include "sorocost/cost_model.hpp"

namespace sorocost::scoring {

constexpr int kMaxScore = 100;
constexpr int kMinScore = 0;

constexpr double kGoodThreshold = 0.5;
constexpr double kPoorThreshold = 0.8;
constexpr double kExhaustedUtilization = 1.0;

constexpr double kExcellentFloorScore = 80.0;
constexpr double kGoodFloorScore = 50.0;

/// Aggregate weights; memory carries no direct fee and counts half
constexpr double kCpuWeight = 0.4;
constexpr double kMemoryWeight = 0.2;
constexpr double kLedgerWeight = 0.4;

struct Scores
{
    int cpu;
    int memory;
    int ledger;
    int total;

    bool operator==(const Scores&) const = default;
};

/**
 * Score one utilization ratio
 * @param utilization Non-negative ratio, may exceed 1.0
 * @return Integer score in [0, 100]
 */
[[nodiscard]] int score_dimension(double utilization);

/**
 * Score each dimension and the weighted aggregate (floored)
 */
[[nodiscard]] Scores compute_scores(const cost::CpuCost& cpu,
                                    const cost::MemoryCost& memory,
                                    const cost::LedgerCost& ledger);

}  // namespace sorocost::scoring
