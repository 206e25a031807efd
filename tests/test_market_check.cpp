#include <gtest/gtest.h>
#include "market_check.hpp"
#include <limits>

TEST(MarketCheckTest, WithinLimits) {
    EXPECT_TRUE(MarketCheck::is_safe(0.1, 0.01, 0.5, 0.02));
}

TEST(MarketCheckTest, LimitsAreInclusive) {
    EXPECT_TRUE(MarketCheck::is_safe(0.5, 0.02, 0.5, 0.02));
}

TEST(MarketCheckTest, SpreadTooWide) {
    EXPECT_FALSE(MarketCheck::is_safe(0.6, 0.01, 0.5, 0.02));
    // Any volatility, including one within its ceiling
    EXPECT_FALSE(MarketCheck::is_safe(0.6, 0.0, 0.5, 0.02));
    EXPECT_FALSE(MarketCheck::is_safe(0.6, 5.0, 0.5, 0.02));
}

TEST(MarketCheckTest, VolatilityTooHigh) {
    EXPECT_FALSE(MarketCheck::is_safe(0.1, 0.03, 0.5, 0.02));
}

TEST(MarketCheckTest, NegativeInputsCompareAsIs) {
    EXPECT_TRUE(MarketCheck::is_safe(-1.0, -1.0, 0.0, 0.0));
    EXPECT_FALSE(MarketCheck::is_safe(0.0, 0.0, -1.0, 0.0));
}

TEST(MarketCheckTest, NaNIsTreatedAsSafe) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(MarketCheck::is_safe(nan, 0.01, 0.5, 0.02));
    EXPECT_TRUE(MarketCheck::is_safe(0.1, nan, 0.5, 0.02));
    EXPECT_TRUE(MarketCheck::is_safe(0.1, 0.01, nan, nan));
}

TEST(MarketCheckTest, SnapshotOverload) {
    MarketLimits limits{0.5, 0.02};

    EXPECT_TRUE(MarketCheck::is_safe(MarketSnapshot{100.0, 0.5, 0.02}, limits));
    EXPECT_FALSE(MarketCheck::is_safe(MarketSnapshot{100.0, 0.51, 0.02}, limits));
    EXPECT_FALSE(MarketCheck::is_safe(MarketSnapshot{100.0, 0.5, 0.021}, limits));
}
