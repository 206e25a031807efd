#pragma once

#include "types.hpp"
#include <vector>
#include <string>

class SafetyCheck {
public:
    struct Result {
        bool valid;
        std::string reason;
    };

    // Rules run in order and the first failure is reported:
    // amount below min, amount above max, non-positive price, notional above balance.
    // Bounds are inclusive and spending exactly the balance is allowed.
    static Result validate(double price, double amount, double min_amount, double max_amount, double balance);

    static Result validate(const Order& order, const OrderLimits& limits, double balance);

    // One result per order, each judged against the full balance
    static std::vector<Result> validate_all(const std::vector<Order>& orders, const OrderLimits& limits, double balance);
};
