/**
 * @file ForceDirectedEmbedder.hpp
 * @brief Spring relaxation that turns a distance matrix into 2D points.
 */

#pragma once
#include <vector>
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/RandomSource.hpp"
#include "domain/layout/SimilarityKernel.hpp"

namespace regionwalker::domain::layout {

/**
 * @class ForceDirectedEmbedder
 * @brief Places N points so that pairwise distances approximate the matrix.
 *
 * Runs a fixed number of iterations; the result is a heuristic and may come
 * out rotated or mirrored between runs with different start layouts.
 */
class ForceDirectedEmbedder {
public:
    explicit ForceDirectedEmbedder(const ForceConfig& config) : m_config(config) {}

    /**
     * @brief Computes the 2D layout.
     * @param distances Square N x N matrix (1 - similarity).
     * @param rng Used only when ForceConfig::initialJitter is non-zero.
     */
    std::vector<Position2D> Embed(const Matrix& distances, RandomSource& rng) const;

    /** @brief N points evenly spaced on the start circle. */
    std::vector<Position2D> InitialLayout(size_t n, RandomSource& rng) const;

private:
    ForceConfig m_config;
};

} // namespace regionwalker::domain::layout
