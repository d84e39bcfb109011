#include <cassert>
#include <iostream>
#include <numeric>

#include "domain/layout/LayoutNormalizer.hpp"
#include "TestSupport.hpp"

using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;
using regionwalker::test::Near;

namespace {

double StdDev(const std::vector<double>& values) {
    double sumSq = 0.0;
    for (double v : values) sumSq += v * v;
    return std::sqrt(sumSq / values.size());
}

} // namespace

int main() {
    std::cout << "[Test] Starting LayoutNormalizer Test..." << std::endl;

    assert(Near(LayoutNormalizer::WrapAngle(1.5 * kPi), -0.5 * kPi) && "Wraps above pi");
    assert(Near(LayoutNormalizer::WrapAngle(-2.5 * kPi), -0.5 * kPi) && "Wraps below -pi");
    assert(LayoutNormalizer::MaxAngularGap({}) == 0.0 && "No angles, no gap");
    assert(Near(LayoutNormalizer::MaxAngularGap({0.3}), 2.0 * kPi) && "Single angle leaves a full turn");
    assert(Near(LayoutNormalizer::MaxAngularGap({0.0, 0.5 * kPi}), 1.5 * kPi) && "Gap across the wrap");
    std::cout << "[PASS] Angle helpers." << std::endl;

    // Anisotropic, off-center input
    std::vector<Position2D> skewed = {{10, 5}, {14, 5}, {18, 6}, {22, 5}, {10, 4}};
    auto scaled = LayoutNormalizer::CenterAndScale(skewed);
    std::vector<double> xs, ys;
    for (const auto& p : scaled) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }
    assert(Near(std::accumulate(xs.begin(), xs.end(), 0.0) / xs.size(), 0.0, 1e-9) && "Mean x is 0");
    assert(Near(std::accumulate(ys.begin(), ys.end(), 0.0) / ys.size(), 0.0, 1e-9) && "Mean y is 0");
    assert(Near(StdDev(xs), StdDev(ys), 1e-9) && "Both axes share one spread");

    auto collapsed = LayoutNormalizer::CenterAndScale({{3, 3}, {3, 3}});
    assert(Near(collapsed[0], {0, 0}) && Near(collapsed[1], {0, 0}) && "Zero spread does not divide by zero");
    std::cout << "[PASS] Center and scale." << std::endl;

    // Evenly spread square: no swirl, angles kept
    LayoutNormalizer defaults(NormalizerConfig{});
    auto square = defaults.Normalize({{1, 0}, {0, 1}, {-1, 0}, {0, -1}});
    assert(!square.swirled && "Balanced layout is not swirled");
    for (size_t i = 0; i < 4; ++i) {
        assert(regionwalker::test::AngularDistance(square.angles[i], square.rawAngles[i]) < 1e-6 &&
               "Rotation search keeps the raw angles");
    }
    std::cout << "[PASS] Balanced layout." << std::endl;

    // Fan with a large empty sector (largest gap ~1.9x the mean gap)
    std::vector<Position2D> fan = {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {0, 1}};
    assert(!defaults.Normalize(fan).swirled && "Below the default ratio nothing is redistributed");

    NormalizerConfig sensitive;
    sensitive.swirlGapRatio = 1.5;
    auto swirled = LayoutNormalizer(sensitive).Normalize(fan);
    assert(swirled.swirled && "Above the ratio the layout counts as swirled");

    std::vector<size_t> order(fan.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return swirled.rawAngles[a] < swirled.rawAngles[b];
    });
    for (size_t rank = 0; rank < order.size(); ++rank) {
        double expected = 2.0 * kPi * rank / order.size();
        assert(Near(swirled.angles[order[rank]], expected) && "Even angles in original angular order");
    }
    assert(Near(LayoutNormalizer::MaxAngularGap(swirled.angles), 2.0 * kPi / fan.size()) &&
           "Redistributed gaps are all equal");
    std::cout << "[PASS] Swirl redistribution." << std::endl;

    assert(defaults.Normalize({}).points.empty() && "Empty input");
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
