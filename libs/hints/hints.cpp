/**
 * @file hints.cpp
 * @brief Optimization hint rules
 */

#include "sorocost/hints.hpp"

#include <cmath>
#include <format>

namespace sorocost::hints {

namespace {

void append_cpu_hints(std::vector<std::string>& hints, const cost::CpuCost& cpu)
{
    if (cpu.normalized > kCpuCriticalThreshold) {
        hints.push_back(std::format("CRITICAL: CPU usage at {:.0f}%. Reduce instruction count.",
                                    cpu.normalized * 100.0));
    } else if (cpu.normalized > kCpuHighThreshold) {
        hints.emplace_back("HIGH CPU: Optimize hot loops and host function calls.");
    }

    if (cpu.ledger_pressure > kLedgerPressureThreshold) {
        // sqrt recovers the ledger-relative utilization from the quadratic term.
        hints.push_back(std::format("High ledger CPU pressure ({:.1f}%).",
                                    std::sqrt(cpu.ledger_pressure) * 100.0));
    }
}

void append_memory_hints(std::vector<std::string>& hints, const cost::MemoryCost& memory)
{
    if (memory.normalized > kMemoryCriticalThreshold) {
        hints.push_back(std::format("CRITICAL: Memory usage at {:.0f}%. Optimize allocations.",
                                    memory.normalized * 100.0));
    } else if (memory.normalized > kMemoryModerateThreshold) {
        hints.emplace_back("MODERATE memory usage. Review data structure sizes.");
    }
}

void append_ledger_hints(std::vector<std::string>& hints, const cost::LedgerCost& ledger)
{
    for (const auto& [dim, utilization] : ledger.breakdown.entries()) {
        if (utilization > kLedgerDimensionThreshold) {
            hints.push_back(std::format("HIGH {}. Consider batching or compression.",
                                        cost::dimension_label(dim)));
        }
    }
}

}  // namespace

std::vector<std::string> generate_hints(const cost::CpuCost& cpu,
                                        const cost::MemoryCost& memory,
                                        const cost::LedgerCost& ledger)
{
    std::vector<std::string> hints;

    append_cpu_hints(hints, cpu);
    append_memory_hints(hints, memory);
    append_ledger_hints(hints, ledger);

    if (cpu.normalized > kRedundantAccessCpuThreshold
        && ledger.breakdown.at(cost::LedgerDimension::kReadEntries)
               > kRedundantAccessReadThreshold) {
        hints.emplace_back("TIP: High CPU + reads. Check for redundant storage accesses.");
    }

    if (hints.empty()) {
        hints.emplace_back(kEfficientMessage);
    }
    return hints;
}

}  // namespace sorocost::hints
