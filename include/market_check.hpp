#pragma once

#include "types.hpp"

class MarketCheck {
public:
    // False when spread or volatility is strictly above its ceiling.
    // NaN inputs compare false and pass.
    static bool is_safe(double spread, double volatility, double max_spread, double max_volatility);

    static bool is_safe(const MarketSnapshot& market, const MarketLimits& limits);
};
