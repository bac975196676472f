/**
 * @file test_safety.cpp
 * @brief Safety margin tests
 */

#include "fixtures.hpp"
#include "sorocost/safety.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace sorocost::safety::test {

namespace {

using sorocost::test::cpu_at;
using sorocost::test::memory_at;
using sorocost::test::uniform_ledger;

}  // namespace

TEST(CheckSafety, NothingBelowMargin)
{
    EXPECT_TRUE(check_safety(cpu_at(0.9), memory_at(0.9), uniform_ledger(0.9)).empty());
}

TEST(CheckSafety, MarginIsExclusive)
{
    EXPECT_TRUE(check_safety(cpu_at(0.95), memory_at(0.95), uniform_ledger(0.95)).empty());
}

TEST(CheckSafety, CpuAndMemory)
{
    auto violations = check_safety(cpu_at(0.96), memory_at(0.96), uniform_ledger(0.0));
    const std::vector<std::string> expected = {
        "CPU exceeds 95% safety margin",
        "Memory exceeds 95% safety margin",
    };
    EXPECT_EQ(violations, expected);
}

TEST(CheckSafety, LedgerDimensionsNamed)
{
    auto ledger = uniform_ledger(0.1);
    ledger.breakdown.set(cost::LedgerDimension::kWriteBytes, 0.97);
    ledger.breakdown.set(cost::LedgerDimension::kReadEntries, 1.5);

    auto violations = check_safety(cpu_at(0.1), memory_at(0.1), ledger);
    const std::vector<std::string> expected = {
        "Ledger read_entries exceeds 95% safety margin",
        "Ledger write_bytes exceeds 95% safety margin",
    };
    EXPECT_EQ(violations, expected);
}

TEST(CheckSafety, CompositeLedgerIsNotChecked)
{
    // Only the per-dimension breakdown counts
    auto ledger = uniform_ledger(0.5);
    ledger.normalized = 2.0;
    EXPECT_TRUE(check_safety(cpu_at(0.1), memory_at(0.1), ledger).empty());
}

}  // namespace sorocost::safety::test
