#pragma once

#include <string>
#include <nlohmann/json.hpp>

class GateRequest {
public:
    struct Outcome {
        nlohmann::json output;
        int exit_code;
    };

    // Runs one JSON request through the gate.
    // exit_code: 0 all accepted, 1 malformed request, 2 market unsafe or an order rejected.
    static Outcome process(const nlohmann::json& input);

    static Outcome error(const std::string& message);
};
