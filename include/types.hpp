#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

enum class Side {
    BUY,
    SELL
};

// Side is a closed set: anything other than "buy"/"sell" is refused while parsing
inline void to_json(nlohmann::json& j, const Side& side) {
    j = (side == Side::BUY) ? "buy" : "sell";
}

inline void from_json(const nlohmann::json& j, Side& side) {
    const auto value = j.get<std::string>();
    if (value == "buy") {
        side = Side::BUY;
    } else if (value == "sell") {
        side = Side::SELL;
    } else {
        throw std::invalid_argument("Unknown order side: " + value);
    }
}

struct Order {
    std::string id;
    double price;
    double amount;
    Side side;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Order, id, price, amount, side)
};

struct MarketSnapshot {
    double current_price;
    double spread;
    double volatility;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(MarketSnapshot, current_price, spread, volatility)
};

// Inclusive ceilings
struct MarketLimits {
    double max_spread;
    double max_volatility;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(MarketLimits, max_spread, max_volatility)
};

// Inclusive amount bounds. Defaults match the execution engine's call site.
struct OrderLimits {
    double min_amount = 0.0001;
    double max_amount = 10.0;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(OrderLimits, min_amount, max_amount)
};

struct GateConfig {
    MarketLimits market;
    OrderLimits order;
};

// "market" is required, "order" falls back to the OrderLimits defaults
inline void to_json(nlohmann::json& j, const GateConfig& config) {
    j = nlohmann::json{{"market", config.market}, {"order", config.order}};
}

inline void from_json(const nlohmann::json& j, GateConfig& config) {
    config.market = j.at("market").get<MarketLimits>();
    config.order = j.value("order", OrderLimits{});
}
