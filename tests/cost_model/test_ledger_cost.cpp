/**
 * @file test_ledger_cost.cpp
 * @brief Ledger I/O and bandwidth cost tests
 */

#include "fixtures.hpp"
#include "sorocost/config.hpp"
#include "sorocost/cost_model.hpp"

#include <gtest/gtest.h>

namespace sorocost::cost::test {

namespace {

using sorocost::test::make_sim;

const config::NetworkConfig kConfig = config::default_config();

}  // namespace

TEST(BillableKilobytes, RoundsPartialKilobytesUp)
{
    EXPECT_EQ(billable_kilobytes(0), 0);
    EXPECT_EQ(billable_kilobytes(1), 1);
    EXPECT_EQ(billable_kilobytes(1024), 1);
    EXPECT_EQ(billable_kilobytes(1025), 2);
    EXPECT_EQ(billable_kilobytes(3000), 3);
}

TEST(LedgerCost, ReadOnlyTransaction)
{
    auto sim = make_sim(0, 0, {"entry1", "entry2", "entry3"}, {}, 3000, 0, 1024);
    auto cost = compute_ledger_cost(sim, kConfig);

    EXPECT_NEAR(cost.breakdown.at(LedgerDimension::kReadEntries), 3.0 / 40.0, 1e-12);
    EXPECT_EQ(cost.breakdown.at(LedgerDimension::kWriteEntries), 0.0);
    // 3 entries + 3 KB read + 1 KB transaction
    EXPECT_NEAR(cost.fee, 3 * 0.0001 + 3 * 0.00005 + 1 * 0.00001, 1e-12);
}

TEST(LedgerCost, WriteHeavyTransaction)
{
    auto sim = make_sim(0, 0, {"entry1"}, {"entry2", "entry3", "entry4", "entry5"}, 1000, 8000,
                        2048);
    auto cost = compute_ledger_cost(sim, kConfig);

    EXPECT_NEAR(cost.breakdown.at(LedgerDimension::kWriteEntries), 4.0 / 25.0, 1e-12);
    EXPECT_NEAR(cost.breakdown.at(LedgerDimension::kWriteBytes), 8000.0 / 100'000.0, 1e-12);
    EXPECT_NEAR(cost.fee,
                1 * 0.0001 + 1 * 0.00005 + 4 * 0.0002 + 8 * 0.0001 + 2 * 0.00001,
                1e-12);
}

TEST(LedgerCost, LargeTransactionBandwidth)
{
    auto cost = compute_ledger_cost(make_sim(0, 0, {}, {}, 0, 0, 50'000), kConfig);
    EXPECT_NEAR(cost.breakdown.at(LedgerDimension::kBandwidth), 0.5, 1e-12);
    EXPECT_NEAR(cost.normalized, 0.1, 1e-12);
    EXPECT_NEAR(cost.fee, 49 * 0.00001, 1e-12);
}

TEST(LedgerCost, BandwidthBillingRoundsUp)
{
    const double one_byte = compute_ledger_cost(make_sim(0, 0, {}, {}, 0, 0, 1), kConfig).fee;
    const double one_kb = compute_ledger_cost(make_sim(0, 0, {}, {}, 0, 0, 1024), kConfig).fee;
    const double over_kb = compute_ledger_cost(make_sim(0, 0, {}, {}, 0, 0, 1025), kConfig).fee;

    EXPECT_DOUBLE_EQ(one_byte, kConfig.fee_tx_size_1kb);
    EXPECT_DOUBLE_EQ(one_kb, kConfig.fee_tx_size_1kb);
    EXPECT_DOUBLE_EQ(over_kb, 2 * kConfig.fee_tx_size_1kb);
}

TEST(LedgerCost, DuplicateKeysAreCounted)
{
    auto cost = compute_ledger_cost(make_sim(0, 0, {"same", "same"}, {"k", "k", "k"}), kConfig);
    EXPECT_NEAR(cost.breakdown.at(LedgerDimension::kReadEntries), 2.0 / 40.0, 1e-12);
    EXPECT_NEAR(cost.breakdown.at(LedgerDimension::kWriteEntries), 3.0 / 25.0, 1e-12);
    EXPECT_NEAR(cost.fee, 2 * 0.0001 + 3 * 0.0002, 1e-12);
}

TEST(LedgerCost, CompositeIsEqualWeighted)
{
    auto cost = compute_ledger_cost(sorocost::test::complex_marketplace(), kConfig);
    const double expected = 0.2 * (6.0 / 40 + 45'000.0 / 200'000 + 4.0 / 25 + 12'000.0 / 100'000
                                   + 18'000.0 / 100'000);
    EXPECT_NEAR(cost.normalized, expected, 1e-12);
}

TEST(LedgerCost, BreakdownKeepsDimensionOrder)
{
    auto cost = compute_ledger_cost(sorocost::test::simple_token_transfer(), kConfig);
    const auto entries = cost.breakdown.entries();
    ASSERT_EQ(entries.size(), 5U);
    EXPECT_EQ(dimension_name(entries[0].first), "read_entries");
    EXPECT_EQ(dimension_name(entries[1].first), "read_bytes");
    EXPECT_EQ(dimension_name(entries[2].first), "write_entries");
    EXPECT_EQ(dimension_name(entries[3].first), "write_bytes");
    EXPECT_EQ(dimension_name(entries[4].first), "bandwidth");
    EXPECT_NEAR(entries[0].second, 2.0 / 40.0, 1e-12);
}

TEST(LedgerCost, EmptyFootprintIsZero)
{
    auto cost = compute_ledger_cost(make_sim(0, 0), kConfig);
    EXPECT_EQ(cost.fee, 0.0);
    EXPECT_EQ(cost.normalized, 0.0);
    for (const auto& [dim, utilization] : cost.breakdown.entries()) {
        EXPECT_EQ(utilization, 0.0) << dimension_name(dim);
    }
}

}  // namespace sorocost::cost::test
