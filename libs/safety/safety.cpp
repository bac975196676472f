/**
 * @file safety.cpp
 * @brief Safety margin violations
 */

#include "sorocost/safety.hpp"

namespace sorocost::safety {

std::vector<std::string> check_safety(const cost::CpuCost& cpu,
                                      const cost::MemoryCost& memory,
                                      const cost::LedgerCost& ledger)
{
    std::vector<std::string> violations;
    if (cpu.normalized > kSafetyMargin) {
        violations.emplace_back("CPU exceeds 95% safety margin");
    }
    if (memory.normalized > kSafetyMargin) {
        violations.emplace_back("Memory exceeds 95% safety margin");
    }
    for (const auto& [dim, utilization] : ledger.breakdown.entries()) {
        if (utilization > kSafetyMargin) {
            violations.push_back("Ledger " + std::string(cost::dimension_name(dim))
                                 + " exceeds 95% safety margin");
        }
    }
    return violations;
}

}  // namespace sorocost::safety
