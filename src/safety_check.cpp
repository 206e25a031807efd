#include "safety_check.hpp"

SafetyCheck::Result SafetyCheck::validate(double price, double amount, double min_amount, double max_amount, double balance) {
    // Check 1: Amount bounds
    if (amount < min_amount) {
        return {false, "Amount below minimum limit"};
    }
    if (amount > max_amount) {
        return {false, "Amount exceeds maximum limit"};
    }

    // Check 2: Price > 0
    if (price <= 0.0) {
        return {false, "Price must be positive"};
    }

    // Check 3: Notional covered by balance
    if (amount * price > balance) {
        return {false, "Insufficient balance"};
    }

    return {true, "Valid"};
}

SafetyCheck::Result SafetyCheck::validate(const Order& order, const OrderLimits& limits, double balance) {
    return validate(order.price, order.amount, limits.min_amount, limits.max_amount, balance);
}

std::vector<SafetyCheck::Result> SafetyCheck::validate_all(
    const std::vector<Order>& orders,
    const OrderLimits& limits,
    double balance
) {
    std::vector<Result> results;
    results.reserve(orders.size());

    for (const auto& order : orders) {
        results.push_back(validate(order, limits, balance));
    }

    return results;
}
