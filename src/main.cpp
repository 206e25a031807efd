#include <iostream>
#include "gate_request.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

int main() {
    // 1. Read Input (Stdin)
    json input;
    try {
        std::cin >> input;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing JSON input: " << e.what() << std::endl;
        auto outcome = GateRequest::error(e.what());
        std::cout << outcome.output.dump(4) << std::endl;
        return outcome.exit_code;
    }

    // 2. Run Gate Stages
    auto outcome = GateRequest::process(input);

    // 3. Output Decisions (Stdout)
    std::cout << outcome.output.dump(4) << std::endl;

    return outcome.exit_code;
}
