#pragma once

/**
 * @file hints.hpp
 * @brief Rule-based optimization hints
 *
 * Rules are evaluated in a fixed order and every firing rule contributes
 * one message:
 *   1. CPU utilization (critical > 0.8, else high > 0.6)
 *   2. CPU ledger pressure > 0.5
 *   3. Memory utilization (critical > 0.7, else moderate > 0.5)
 *   4. Each ledger dimension > 0.75, in LedgerDimension order
 *   5. CPU > 0.7 together with read entries > 0.5
 * If nothing fires, a single efficiency message is returned.
 */

#include "sorocost/cost_model.hpp"

#include <string>
#include <vector>

namespace sorocost::hints {

constexpr double kCpuCriticalThreshold = 0.8;
constexpr double kCpuHighThreshold = 0.6;
constexpr double kLedgerPressureThreshold = 0.5;
constexpr double kMemoryCriticalThreshold = 0.7;
constexpr double kMemoryModerateThreshold = 0.5;
constexpr double kLedgerDimensionThreshold = 0.75;
constexpr double kRedundantAccessCpuThreshold = 0.7;
constexpr double kRedundantAccessReadThreshold = 0.5;

/// Emitted when no rule fires
constexpr const char* kEfficientMessage = "Excellent resource efficiency!";

[[nodiscard]] std::vector<std::string> generate_hints(const cost::CpuCost& cpu,
                                                      const cost::MemoryCost& memory,
                                                      const cost::LedgerCost& ledger);

}  // namespace sorocost::hints
