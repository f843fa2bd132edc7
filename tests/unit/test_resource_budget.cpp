#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

using namespace roundabout;

// ===========================================================================
// Arithmetic
// ===========================================================================

TEST(ResourceBudgetTest, AdditionIsPerDimension) {
    ResourceVector a{1, 2, 3, 4};
    ResourceVector b{10, 20, 30, 40};
    EXPECT_EQ(a + b, (ResourceVector{11, 22, 33, 44}));

    a += b;
    EXPECT_EQ(a, (ResourceVector{11, 22, 33, 44}));
}

TEST(ResourceBudgetTest, ZeroAndNonNegative) {
    EXPECT_TRUE(ResourceVector{}.is_zero());
    EXPECT_FALSE((ResourceVector{0, 0, 1, 0}).is_zero());
    EXPECT_TRUE((ResourceVector{0, 5, 0, 0}).is_non_negative());
    EXPECT_FALSE((ResourceVector{0, -1, 0, 0}).is_non_negative());
}

TEST(ResourceBudgetTest, RemainingFloorsAtZero) {
    ResourceBudget budget{10, 100, 1024, 30000};
    ResourceUsage usage{12, 40, 0, 30000};
    EXPECT_EQ(remaining(budget, usage), (ResourceVector{0, 60, 1024, 0}));
}

// ===========================================================================
// Scaling
// ===========================================================================

TEST(ResourceBudgetTest, ScaledFloorOfTypicalBudget) {
    ResourceBudget budget{10, 100, 1024, 30000};
    EXPECT_EQ(scaled_floor(budget, 0.3), (ResourceVector{3, 30, 307, 9000}));
}

TEST(ResourceBudgetTest, ScaledFloorMatchesIntegerArithmetic) {
    for (ResourceQuantity x = 0; x <= 2000; ++x) {
        ResourceVector v{x, x, x, x};
        auto scaled = scaled_floor(v, 0.3);
        ResourceQuantity expected = (3 * x) / 10;
        ASSERT_EQ(scaled.llm_calls, expected) << "x=" << x;
        ASSERT_EQ(scaled.execution_time_ms, expected) << "x=" << x;
    }
}

TEST(ResourceBudgetTest, ScaledCeilKeepsZeroAndRoundsUp) {
    EXPECT_EQ(scaled_ceil(ResourceVector{0, 5, 4, 1}, 0.5), (ResourceVector{0, 3, 2, 1}));
}

// ===========================================================================
// Comparisons
// ===========================================================================

TEST(ResourceBudgetTest, FitsWithinIsInclusive) {
    ResourceBudget budget{10, 100, 1024, 30000};
    EXPECT_TRUE(fits_within(budget, budget));
    EXPECT_FALSE(fits_within(ResourceUsage{11, 0, 0, 0}, budget));
    EXPECT_FALSE(fits_within(ResourceUsage{0, 0, 0, 30001}, budget));
}

TEST(ResourceBudgetTest, ExceedsFractionIsStrict) {
    ResourceBudget budget{10, 100, 1000, 30000};
    EXPECT_FALSE(exceeds_fraction(ResourceUsage{9, 90, 900, 27000}, budget, 0.9));
    EXPECT_TRUE(exceeds_fraction(ResourceUsage{10, 0, 0, 0}, budget, 0.9));
    EXPECT_TRUE(exceeds_fraction(ResourceUsage{0, 0, 901, 0}, budget, 0.9));
}

TEST(ResourceBudgetTest, HasRemainingIgnoresExecutionTime) {
    ResourceBudget budget{10, 100, 1024, 30000};
    EXPECT_TRUE(has_remaining(ResourceUsage{9, 99, 1023, 99999}, budget));
    EXPECT_FALSE(has_remaining(ResourceUsage{10, 0, 0, 0}, budget));
    EXPECT_FALSE(has_remaining(ResourceUsage{0, 100, 0, 0}, budget));
}

TEST(ResourceBudgetTest, ToStringListsEveryDimension) {
    EXPECT_EQ(to_string(ResourceVector{1, 2, 3, 4}),
              "{calls=1, compute=2, storage=3, time_ms=4}");
}
