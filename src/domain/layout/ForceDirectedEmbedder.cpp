#include "domain/layout/ForceDirectedEmbedder.hpp"
#include <cmath>
#include <algorithm>

namespace regionwalker::domain::layout {

std::vector<Position2D> ForceDirectedEmbedder::InitialLayout(size_t n, RandomSource& rng) const {
    std::vector<Position2D> layout;
    layout.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double angle = (2.0 * kPi * static_cast<double>(i)) / static_cast<double>(n);
        Position2D p{m_config.initialRadius * std::cos(angle), m_config.initialRadius * std::sin(angle)};
        if (m_config.initialJitter > 0.0) {
            p.x += (rng.nextUniform() - 0.5) * m_config.initialJitter;
            p.y += (rng.nextUniform() - 0.5) * m_config.initialJitter;
        }
        layout.push_back(p);
    }
    return layout;
}

std::vector<Position2D> ForceDirectedEmbedder::Embed(const Matrix& distances, RandomSource& rng) const {
    const size_t n = distances.size();
    std::vector<Position2D> layout = InitialLayout(n, rng);
    if (n < 2) return layout;

    std::vector<std::pair<double, double>> forces(n, {0.0, 0.0});

    for (int iter = 0; iter < m_config.iterations; ++iter) {
        std::fill(forces.begin(), forces.end(), std::make_pair(0.0, 0.0));

        // Pairwise springs toward the ideal distance
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                double dx = layout[j].x - layout[i].x;
                double dy = layout[j].y - layout[i].y;
                double dist = std::max(std::sqrt(dx * dx + dy * dy), m_config.minDistance);
                double ideal = distances[i][j] * m_config.springConstant;
                double force = (dist - ideal) / dist;

                double fx = (dx / dist) * force;
                double fy = (dy / dist) * force;
                forces[i].first += fx;
                forces[i].second += fy;
                forces[j].first -= fx;
                forces[j].second -= fy;
            }
        }

        for (size_t i = 0; i < n; ++i) {
            layout[i].x += forces[i].first * m_config.damping;
            layout[i].y += forces[i].second * m_config.damping;
        }
    }

    return layout;
}

} // namespace regionwalker::domain::layout
