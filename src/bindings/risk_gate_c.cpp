#include "risk_gate_c.h"
#include "market_check.hpp"
#include "safety_check.hpp"
#include <cstdio>

extern "C" int is_safe_entry(double /*current_price*/, double spread, double volatility, double max_spread, double max_volatility) {
    return MarketCheck::is_safe(spread, volatility, max_spread, max_volatility) ? 1 : 0;
}

extern "C" int validate_order(double price, double amount, double min_amount, double max_amount, double balance,
                              char* reason, size_t reason_size) {
    const auto result = SafetyCheck::validate(price, amount, min_amount, max_amount, balance);

    if (reason != nullptr && reason_size > 0) {
        std::snprintf(reason, reason_size, "%s", result.reason.c_str());
    }

    return result.valid ? 1 : 0;
}
