/**
 * @file CrowdPlacer.hpp
 * @brief Grid (Regiment) and organic scatter (Gaggle) crowd placement.
 */

#pragma once
#include <vector>
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/RandomSource.hpp"

namespace regionwalker::domain::layout {

/**
 * @struct CrowdPoint
 * @brief One placed crowd member.
 */
struct CrowdPoint {
    Position2D position;
    PlacementOutcome outcome = PlacementOutcome::Strict;
};

class CrowdPlacer {
public:
    CrowdPlacer(const CanvasConfig& canvas, const RegimentConfig& regiment, const GaggleConfig& gaggle)
        : m_canvas(canvas), m_regiment(regiment), m_gaggle(gaggle) {}

    /** @brief floor(sqrt(n)) columns, never less than one. */
    static int RegimentColumns(size_t n);

    /** @brief Row-major grid starting at the origin; the first cell sits exactly on it. */
    std::vector<Position2D> Regiment(size_t n, const Position2D& origin) const;

    /** @brief Minimum center distance between two Gaggle members. */
    double GaggleSpacing() const;

    /** @brief Radius of the disk the strict phase samples from. */
    double GaggleRadius(size_t n) const;

    /**
     * @brief Scatters n items around the origin without overlap where possible.
     *
     * Strict phase, then relaxed phase; when both budgets run out the best
     * candidate seen is accepted and flagged BestEffort.
     */
    std::vector<CrowdPoint> Gaggle(size_t n, const Position2D& origin, RandomSource& rng) const;

    /** @brief Box-Muller normal deviate. */
    static double Gaussian(RandomSource& rng, double mean, double stdDev);

private:
    CanvasConfig m_canvas;
    RegimentConfig m_regiment;
    GaggleConfig m_gaggle;
};

} // namespace regionwalker::domain::layout
