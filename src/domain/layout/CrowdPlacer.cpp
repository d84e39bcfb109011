#include "domain/layout/CrowdPlacer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace regionwalker::domain::layout {

namespace {

double NearestDistance(const Position2D& p, const std::vector<CrowdPoint>& placed) {
    double nearest = std::numeric_limits<double>::infinity();
    for (const auto& other : placed) {
        double dx = p.x - other.position.x;
        double dy = p.y - other.position.y;
        nearest = std::min(nearest, std::sqrt(dx * dx + dy * dy));
    }
    return nearest;
}

} // namespace

int CrowdPlacer::RegimentColumns(size_t n) {
    int columns = static_cast<int>(std::floor(std::sqrt(static_cast<double>(n))));
    return std::max(1, columns);
}

std::vector<Position2D> CrowdPlacer::Regiment(size_t n, const Position2D& origin) const {
    std::vector<Position2D> cells;
    cells.reserve(n);
    const int columns = RegimentColumns(n);
    const double pitchX = m_canvas.noteWidth + m_regiment.gridGap;
    const double pitchY = m_canvas.noteHeight + m_regiment.gridGap;

    for (size_t i = 0; i < n; ++i) {
        int row = static_cast<int>(i) / columns;
        int col = static_cast<int>(i) % columns;
        cells.push_back({origin.x + col * pitchX, origin.y + row * pitchY});
    }
    return cells;
}

double CrowdPlacer::GaggleSpacing() const {
    return std::max(m_canvas.noteWidth, m_canvas.noteHeight) + m_gaggle.spacingPadding;
}

double CrowdPlacer::GaggleRadius(size_t n) const {
    const double spacing = GaggleSpacing();
    const double area = static_cast<double>(n) * spacing * spacing;
    return std::max(m_gaggle.minRadius, std::sqrt(area / kPi) * m_gaggle.radiusScale);
}

double CrowdPlacer::Gaussian(RandomSource& rng, double mean, double stdDev) {
    double u1 = std::max(rng.nextUniform(), 1e-10);
    double u2 = rng.nextUniform();
    double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * kPi * u2);
    return z0 * stdDev + mean;
}

std::vector<CrowdPoint> CrowdPlacer::Gaggle(size_t n, const Position2D& origin, RandomSource& rng) const {
    std::vector<CrowdPoint> placed;
    placed.reserve(n);
    if (n == 0) return placed;

    const double spacing = GaggleSpacing();
    const double baseRadius = GaggleRadius(n);

    for (size_t i = 0; i < n; ++i) {
        std::optional<Position2D> accepted;
        PlacementOutcome outcome = PlacementOutcome::Strict;

        // Fallback candidate: in bounds and as far from its nearest neighbour as seen so far
        Position2D fallback = origin;
        double fallbackScore = -1.0;
        bool fallbackInBounds = false;

        const GagglePhase* phases[] = {&m_gaggle.strict, &m_gaggle.relaxed};
        const PlacementOutcome phaseOutcome[] = {PlacementOutcome::Strict, PlacementOutcome::Relaxed};

        for (int phaseIdx = 0; phaseIdx < 2 && !accepted; ++phaseIdx) {
            const GagglePhase& phase = *phases[phaseIdx];
            const double radius = baseRadius * phase.radiusExpansion;
            const double bound = radius * phase.boundFactor;

            for (int attempt = 0; attempt < phase.attempts; ++attempt) {
                double angle = rng.nextUniform() * 2.0 * kPi;
                double r = std::sqrt(rng.nextUniform()) * radius;
                Position2D candidate{origin.x + r * std::cos(angle), origin.y + r * std::sin(angle)};

                candidate.x += Gaussian(rng, 0.0, spacing * phase.noiseFactor);
                candidate.y += Gaussian(rng, 0.0, spacing * phase.noiseFactor);
                candidate.x += (rng.nextUniform() - 0.5) * spacing * phase.jitterFactor;
                candidate.y += (rng.nextUniform() - 0.5) * spacing * phase.jitterFactor;

                double dx = candidate.x - origin.x;
                double dy = candidate.y - origin.y;
                bool inBounds = std::sqrt(dx * dx + dy * dy) <= bound;
                double nearest = NearestDistance(candidate, placed);

                if (inBounds && nearest >= spacing) {
                    accepted = candidate;
                    outcome = phaseOutcome[phaseIdx];
                    break;
                }

                if (inBounds && (!fallbackInBounds || nearest > fallbackScore)) {
                    fallback = candidate;
                    fallbackScore = nearest;
                    fallbackInBounds = true;
                } else if (!fallbackInBounds) {
                    fallback = candidate;
                }
            }
        }

        if (!accepted) {
            accepted = fallback;
            outcome = PlacementOutcome::BestEffort;
        }
        placed.push_back({*accepted, outcome});
    }

    return placed;
}

} // namespace regionwalker::domain::layout
