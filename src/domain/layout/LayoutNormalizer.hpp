/**
 * @file LayoutNormalizer.hpp
 * @brief Centers and rescales a 2D layout and derives balanced polar angles.
 */

#pragma once
#include <vector>
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"

namespace regionwalker::domain::layout {

/**
 * @struct NormalizedLayout
 * @brief Output of LayoutNormalizer::Normalize.
 */
struct NormalizedLayout {
    std::vector<Position2D> points; ///< Centered, equal spread on both axes.
    std::vector<double> rawAngles;  ///< atan2 of each normalized point.
    std::vector<double> angles;     ///< Balanced angle per item, in [-pi, pi] or [0, 2pi).
    bool swirled = false;           ///< Even redistribution was applied.
    double rotation = 0.0;          ///< Global rotation applied when not swirled.
};

/**
 * @class LayoutNormalizer
 * @brief Removes translation, anisotropic stretch and angular clumping.
 *
 * A layout counts as swirled when its largest angular gap exceeds
 * swirlGapRatio times the mean gap; items then get evenly spaced angles in
 * their original angular order. Otherwise the rotation (searched in
 * rotationStepDegrees steps) with the smallest largest gap is kept.
 */
class LayoutNormalizer {
public:
    explicit LayoutNormalizer(const NormalizerConfig& config) : m_config(config) {}

    NormalizedLayout Normalize(const std::vector<Position2D>& layout) const;

    /** @brief Subtracts the mean and scales both axes to the average std-dev. */
    static std::vector<Position2D> CenterAndScale(const std::vector<Position2D>& layout);

    /** @brief Largest circular gap between the given angles (radians). */
    static double MaxAngularGap(std::vector<double> angles);

    /** @brief Wraps an angle into [-pi, pi]. */
    static double WrapAngle(double angle);

private:
    NormalizerConfig m_config;
};

} // namespace regionwalker::domain::layout
