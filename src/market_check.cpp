#include "market_check.hpp"

bool MarketCheck::is_safe(double spread, double volatility, double max_spread, double max_volatility) {
    if (spread > max_spread) {
        return false;
    }
    if (volatility > max_volatility) {
        return false;
    }
    return true;
}

bool MarketCheck::is_safe(const MarketSnapshot& market, const MarketLimits& limits) {
    return is_safe(market.spread, market.volatility, limits.max_spread, limits.max_volatility);
}
