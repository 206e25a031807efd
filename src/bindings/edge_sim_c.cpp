#include "edge_sim_c.h"
#include "simulation.hpp"
#include <cstdio>

extern "C" size_t run_heavy_sim(const char* data, char* out, size_t out_size) {
    const std::string report = Simulation::run(data != nullptr ? data : "");

    if (out != nullptr && out_size > 0) {
        std::snprintf(out, out_size, "%s", report.c_str());
    }

    return report.size();
}
