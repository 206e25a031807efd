#include "gate_request.hpp"
#include "types.hpp"
#include "market_check.hpp"
#include "safety_check.hpp"
#include "simulation.hpp"
#include <iostream>
#include <optional>
#include <vector>

using json = nlohmann::json;

GateRequest::Outcome GateRequest::error(const std::string& message) {
    json error_output = {
        {"status", "error"},
        {"message", message}
    };
    return {error_output, 1};
}

GateRequest::Outcome GateRequest::process(const json& input) {
    // 1. Parse Limits, Market Snapshot and Orders
    GateConfig config;
    std::optional<MarketSnapshot> market;
    std::optional<std::vector<Order>> orders;
    double balance = 0.0;
    std::optional<std::string> simulate;

    try {
        config = input.at("config").get<GateConfig>();
        if (input.contains("market")) {
            market = input["market"].get<MarketSnapshot>();
        }
        if (input.contains("orders")) {
            orders = input["orders"].get<std::vector<Order>>();
            balance = input.at("balance").get<double>();
        }
        if (input.contains("simulate")) {
            simulate = input["simulate"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error extracting data from JSON: " << e.what() << std::endl;
        return error(e.what());
    }

    json output = json::object();
    bool rejected = false;

    // 2. Run Market-Condition Check
    if (market) {
        bool safe = MarketCheck::is_safe(*market, config.market);
        if (!safe) {
            std::cerr << "Market Check Failed: spread " << market->spread << " (max " << config.market.max_spread
                      << "), volatility " << market->volatility << " (max " << config.market.max_volatility << ")"
                      << std::endl;
            rejected = true;
        }
        output["market_safe"] = safe;
    }

    // 3. Run Order-Validity Check
    if (orders) {
        auto results = SafetyCheck::validate_all(*orders, config.order, balance);

        json decisions = json::array();
        for (size_t i = 0; i < orders->size(); ++i) {
            const auto& order = (*orders)[i];
            if (!results[i].valid) {
                std::cerr << "Safety Check Failed: " << results[i].reason << " for order: " << order.id << std::endl;
                rejected = true;
            }
            decisions.push_back({
                {"id", order.id},
                {"valid", results[i].valid},
                {"reason", results[i].reason}
            });
        }
        output["orders"] = decisions;
    }

    // 4. Optional edge benchmark
    if (simulate) {
        output["simulation"] = Simulation::run(*simulate);
    }

    return {output, rejected ? 2 : 0};
}
