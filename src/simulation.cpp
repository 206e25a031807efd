#include "simulation.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

double Simulation::score(long iterations) {
    double score = 0.0;
    for (long i = 0; i < iterations; ++i) {
        score += std::sin(std::sqrt(static_cast<double>(i)));
    }
    return score;
}

std::string Simulation::run(const std::string& data) {
    std::ostringstream report;
    report << "Simulation Complete. Processed " << kIterations << " iterations. Score: "
           << std::fixed << std::setprecision(4) << score(kIterations)
           << ". Data received: " << data;
    return report.str();
}
