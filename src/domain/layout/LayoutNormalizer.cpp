#include "domain/layout/LayoutNormalizer.hpp"
#include <cmath>
#include <algorithm>
#include <numeric>
#include <limits>

namespace regionwalker::domain::layout {

namespace {
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kRotationTolerance = 1e-9;
}

double LayoutNormalizer::WrapAngle(double angle) {
    while (angle > kPi) angle -= kTwoPi;
    while (angle < -kPi) angle += kTwoPi;
    return angle;
}

double LayoutNormalizer::MaxAngularGap(std::vector<double> angles) {
    if (angles.empty()) return 0.0;
    if (angles.size() == 1) return kTwoPi;

    std::sort(angles.begin(), angles.end());
    double maxGap = 0.0;
    for (size_t i = 0; i + 1 < angles.size(); ++i) {
        maxGap = std::max(maxGap, angles[i + 1] - angles[i]);
    }
    maxGap = std::max(maxGap, angles.front() + kTwoPi - angles.back());
    return maxGap;
}

std::vector<Position2D> LayoutNormalizer::CenterAndScale(const std::vector<Position2D>& layout) {
    const size_t n = layout.size();
    if (n == 0) return {};

    double meanX = 0, meanY = 0;
    for (const auto& p : layout) {
        meanX += p.x;
        meanY += p.y;
    }
    meanX /= static_cast<double>(n);
    meanY /= static_cast<double>(n);

    std::vector<Position2D> centered;
    centered.reserve(n);
    double sumSqX = 0, sumSqY = 0;
    for (const auto& p : layout) {
        Position2D c{p.x - meanX, p.y - meanY};
        sumSqX += c.x * c.x;
        sumSqY += c.y * c.y;
        centered.push_back(c);
    }

    double stdDevX = std::sqrt(sumSqX / static_cast<double>(n));
    double stdDevY = std::sqrt(sumSqY / static_cast<double>(n));
    if (stdDevX == 0.0) stdDevX = 1.0;
    if (stdDevY == 0.0) stdDevY = 1.0;
    double target = (stdDevX + stdDevY) / 2.0;

    for (auto& c : centered) {
        c.x = (c.x / stdDevX) * target;
        c.y = (c.y / stdDevY) * target;
    }
    return centered;
}

NormalizedLayout LayoutNormalizer::Normalize(const std::vector<Position2D>& layout) const {
    NormalizedLayout result;
    const size_t n = layout.size();
    if (n == 0) return result;

    result.points = CenterAndScale(layout);
    result.rawAngles.reserve(n);
    for (const auto& p : result.points) {
        result.rawAngles.push_back(std::atan2(p.y, p.x));
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return result.rawAngles[a] < result.rawAngles[b];
    });

    double maxGap = MaxAngularGap(result.rawAngles);
    double meanGap = kTwoPi / static_cast<double>(n);

    result.angles.assign(n, 0.0);
    if (maxGap > meanGap * m_config.swirlGapRatio) {
        result.swirled = true;
        for (size_t rank = 0; rank < n; ++rank) {
            result.angles[order[rank]] = (kTwoPi * static_cast<double>(rank)) / static_cast<double>(n);
        }
        return result;
    }

    double step = m_config.rotationStepDegrees * kPi / 180.0;
    double bestRotation = 0.0;
    double bestGap = std::numeric_limits<double>::infinity();
    std::vector<double> rotated(n);
    for (int k = 0; ; ++k) {
        double rot = step > 0.0 ? k * step : 0.0;
        if (k > 0 && (step <= 0.0 || rot >= kTwoPi - 1e-12)) break;

        for (size_t i = 0; i < n; ++i) {
            rotated[i] = WrapAngle(result.rawAngles[i] + rot);
        }
        double gap = MaxAngularGap(rotated);
        if (gap < bestGap - kRotationTolerance) {
            bestGap = gap;
            bestRotation = rot;
        }
    }

    result.rotation = bestRotation;
    for (size_t i = 0; i < n; ++i) {
        result.angles[i] = WrapAngle(result.rawAngles[i] + bestRotation);
    }
    return result;
}

} // namespace regionwalker::domain::layout
