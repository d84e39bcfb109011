#include <cassert>
#include <iostream>

#include "domain/layout/RadiusMapper.hpp"
#include "TestSupport.hpp"

using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;
using regionwalker::test::Near;

int main() {
    std::cout << "[Test] Starting RadiusMapper Test..." << std::endl;

    RadiusConfig config;
    RadiusMapper mapper(config);

    assert(mapper.Map({}).empty() && "No scores, no radii");

    std::vector<double> scores = {0.91, 0.2, 0.55, 0.4, 0.7, 0.2};
    auto radii = mapper.Map(scores);
    assert(radii.size() == scores.size() && "One radius per score");
    for (double r : radii) {
        assert(r >= config.rMin && r <= config.rMax && "Radius stays within bounds");
    }
    assert(Near(radii[0], config.rMin, 1e-3) && "Most similar note sits on the inner ring");
    assert(Near(radii[1], config.rMax, 1e-3) && "Least similar note sits on the outer ring");
    assert(radii[1] == radii[5] && "Equal scores map to equal radii");
    std::cout << "[PASS] Bounds and extremes." << std::endl;

    for (size_t i = 0; i < scores.size(); ++i) {
        for (size_t j = 0; j < scores.size(); ++j) {
            if (scores[i] > scores[j]) {
                assert(radii[i] <= radii[j] && "Higher similarity never lands further out");
            }
        }
    }

    // Expansion power above 1 bends mid scores inward of the linear mapping
    auto mid = mapper.Map({0.0, 0.5, 1.0});
    assert(mid[1] < (config.rMin + config.rMax) / 2.0 && "Midpoint maps below the linear midpoint");
    std::cout << "[PASS] Monotonic mapping." << std::endl;

    auto flat = mapper.Map({0.4, 0.4, 0.4});
    for (double r : flat) {
        assert(Near(r, config.rMax) && "All-equal scores collapse onto rMax without NaN");
    }
    std::cout << "[PASS] Degenerate similarities." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
