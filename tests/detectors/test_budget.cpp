#include "stylint/detector.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace stylint::detectors::test {

using namespace std::chrono_literals;

TEST(BudgetTest, UnlimitedNeverExpires)
{
    const Budget budget = Budget::unlimited();
    EXPECT_FALSE(budget.expired());
    EXPECT_FALSE(budget.deadline().has_value());
    EXPECT_TRUE(budget.check("reentrancy"));
}

TEST(BudgetTest, ZeroDurationIsSpent)
{
    const Budget budget = Budget::for_duration(0ms);
    EXPECT_TRUE(budget.expired());
    auto status = budget.check("loop-cost");
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().code, "DetectorTimeout");
    EXPECT_EQ(status.error().message, "loop-cost: time budget exhausted");
}

TEST(BudgetTest, NarrowedKeepsEarlierDeadline)
{
    const Budget outer = Budget::for_duration(1h);
    EXPECT_EQ(outer.narrowed(std::nullopt).deadline(), outer.deadline());

    const Budget tighter = outer.narrowed(10ms);
    ASSERT_TRUE(tighter.deadline());
    EXPECT_LT(*tighter.deadline(), *outer.deadline());

    const Budget looser = Budget::for_duration(10ms).narrowed(1h);
    ASSERT_TRUE(looser.deadline());
    EXPECT_LT(*looser.deadline(), Budget::Clock::now() + 1min);

    EXPECT_TRUE(Budget::unlimited().narrowed(5s).deadline().has_value());
}

TEST(BudgetTest, HugeDurationSaturates)
{
    const std::chrono::milliseconds huge{10'000'000'000'000};
    const Budget budget = Budget::for_duration(huge);
    ASSERT_TRUE(budget.deadline());
    EXPECT_EQ(*budget.deadline(), Budget::Clock::time_point::max());
    EXPECT_FALSE(budget.expired());
    EXPECT_TRUE(budget.check("reentrancy"));

    const Budget narrowed = Budget::unlimited().narrowed(std::chrono::milliseconds::max());
    ASSERT_TRUE(narrowed.deadline());
    EXPECT_EQ(*narrowed.deadline(), Budget::Clock::time_point::max());
    EXPECT_FALSE(narrowed.expired());

    // The earlier deadline still wins.
    EXPECT_LT(*Budget::for_duration(1h).narrowed(huge).deadline(), Budget::Clock::time_point::max());
}

TEST(BudgetTest, CopiesShareTheStopFlag)
{
    const Budget budget;
    const Budget copy = budget;
    const Budget narrowed = budget.narrowed(1h);
    EXPECT_FALSE(narrowed.expired());

    copy.cancel();
    EXPECT_TRUE(budget.expired());
    EXPECT_TRUE(narrowed.expired());
    EXPECT_FALSE(Budget{}.expired());
}

TEST(DetectorRegistryTest, DefaultSetOrder)
{
    const std::vector<std::string> expected = {
        "reentrancy",        "access-control",       "arithmetic-overflow", "trust-boundary",
        "tx-origin",         "timestamp-dependence", "unsafe-code",         "function-cost",
        "storage-read-caching", "redundant-call",    "loop-cost",           "storage-packing",
        "documentation",     "complexity",           "error-handling",      "naming-convention",
        "missing-event",     "unused-storage",
    };
    const auto& set = default_detectors();
    ASSERT_EQ(set.size(), expected.size());
    for (std::size_t i = 0; i < set.size(); ++i) {
        EXPECT_EQ(set[i]->descriptor().id, expected[i]);
        EXPECT_FALSE(set[i]->descriptor().rules.empty()) << expected[i];
    }
    EXPECT_EQ(&set, &default_detectors());
}

TEST(DetectorRegistryTest, FilterByCategory)
{
    const auto& set = default_detectors();
    const auto security = filter_by_category(set, {Category::kSecurity});
    ASSERT_EQ(security.size(), 7U);
    EXPECT_EQ(security.front()->descriptor().id, "reentrancy");

    const auto gas_and_quality = filter_by_category(set, {Category::kQuality, Category::kPerformance});
    ASSERT_EQ(gas_and_quality.size(), 11U);
    // Registry order wins over the order of the requested categories.
    EXPECT_EQ(gas_and_quality.front()->descriptor().id, "function-cost");
    EXPECT_EQ(gas_and_quality.back()->descriptor().id, "unused-storage");

    EXPECT_TRUE(filter_by_category(set, {}).empty());
}

}  // namespace stylint::detectors::test
