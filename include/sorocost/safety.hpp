#pragma once

/**
 * @file safety.hpp
 * @brief Hard 95% utilization margin check
 */

#include "sorocost/cost_model.hpp"

#include <string>
#include <vector>

namespace sorocost::safety {

constexpr double kSafetyMargin = 0.95;

/**
 * List every dimension whose utilization exceeds kSafetyMargin.
 * Order: CPU, memory, then ledger dimensions in LedgerDimension order.
 */
[[nodiscard]] std::vector<std::string> check_safety(const cost::CpuCost& cpu,
                                                    const cost::MemoryCost& memory,
                                                    const cost::LedgerCost& ledger);

}  // namespace sorocost::safety
