/**
 * @file WalkaboutComposer.hpp
 * @brief Radial layout: distance encodes concept similarity, angle encodes note-to-note similarity.
 */

#pragma once

#include <vector>
#include <optional>
#include <string>
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/RandomSource.hpp"
#include "domain/layout/ClusterAssigner.hpp"
#include "domain/layout/LayoutNormalizer.hpp"

namespace regionwalker::application {

/**
 * @struct WalkaboutLayout
 * @brief Final positions plus the intermediate layouts they were blended from.
 */
struct WalkaboutLayout {
    std::vector<domain::Position2D> positions;
    std::vector<domain::Position2D> freePositions;
    std::vector<domain::Position2D> clusteredPositions;
    std::vector<double> radii;
    domain::layout::NormalizedLayout normalized;
    domain::layout::ClusterAssignment clusters;
    std::vector<std::optional<double>> clusterAngles;
    std::vector<domain::Card> cards;
    int level = 1;
    double alpha = 0.0;
    double easedAlpha = 0.0;
};

/**
 * @class WalkaboutComposer
 * @brief Blends "free" and "clustered" radial positions by clustering level.
 */
class WalkaboutComposer {
public:
    explicit WalkaboutComposer(const domain::LayoutConfig& config) : m_config(config) {}

    /**
     * @brief Lays out items that all carry an embedding and a concept similarity.
     * @param items Resolved items.
     * @param center Canvas point the concept card sits on.
     * @param clusteringLevel 1..4, clamped.
     * @param conceptText Text of the concept card.
     * @param rng Random source for k-means seeding and start jitter.
     */
    WalkaboutLayout Compose(const std::vector<domain::Item>& items,
                            const domain::Position2D& center,
                            int clusteringLevel,
                            const std::string& conceptText,
                            domain::RandomSource& rng) const;

    /** @brief Ease-in-out quadratic used for the level interpolation. */
    static double EaseInOut(double alpha);

private:
    std::vector<domain::Position2D> ClusteredPositions(const WalkaboutLayout& layout,
                                                       const domain::Position2D& center) const;
    void AddClusterSummaryCards(const std::vector<domain::Item>& items,
                                const domain::Position2D& center,
                                WalkaboutLayout& layout) const;

    domain::LayoutConfig m_config;
};

} // namespace regionwalker::application
