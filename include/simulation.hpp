#pragma once

#include <string>

// CPU throughput benchmark for constrained devices. Independent of the gate.
class Simulation {
public:
    static constexpr long kIterations = 1000000;

    // Sum of sin(sqrt(i)) for i in [0, iterations)
    static double score(long iterations);

    // "Simulation Complete. Processed N iterations. Score: S. Data received: <data>"
    static std::string run(const std::string& data);
};
