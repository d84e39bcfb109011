#include "domain/layout/RadiusMapper.hpp"
#include <algorithm>
#include <cmath>

namespace regionwalker::domain::layout {

std::vector<double> RadiusMapper::Map(const std::vector<double>& similarities) const {
    std::vector<double> radii;
    if (similarities.empty()) return radii;

    auto [minIt, maxIt] = std::minmax_element(similarities.begin(), similarities.end());
    const double sMin = *minIt;
    const double sMax = *maxIt;
    const double span = m_config.rMax - m_config.rMin;

    radii.reserve(similarities.size());
    for (double s : similarities) {
        double normalized = (s - sMin) / (sMax - sMin + m_config.similarityEpsilon);
        double radius = m_config.rMin + (1.0 - normalized) * span;

        // Convex expansion pushes mid-similarity items outward
        if (span > 0.0) {
            double t = std::clamp((radius - m_config.rMin) / span, 0.0, 1.0);
            radius = m_config.rMin + std::pow(t, m_config.expansionPower) * span;
        }
        radii.push_back(std::clamp(radius, m_config.rMin, std::max(m_config.rMin, m_config.rMax)));
    }
    return radii;
}

} // namespace regionwalker::domain::layout
