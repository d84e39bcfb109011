/**
 * @file PathBuilder.hpp
 * @brief Greedy nearest-neighbour ordering for the path layouts.
 */

#pragma once
#include <vector>
#include "domain/LayoutConfig.hpp"
#include "domain/layout/SimilarityKernel.hpp"

namespace regionwalker::domain::layout {

/**
 * @enum PathVariant
 * @brief What each step compares candidates against.
 */
enum class PathVariant {
    Hopscotch,  ///< The last selected item.
    RollingPath ///< Centroid of the concept and every selected item.
};

/**
 * @struct PathResult
 * @brief Ordered selection. stepSimilarities[i] is the score that admitted order[i + 1].
 */
struct PathResult {
    std::vector<int> order;
    std::vector<double> stepSimilarities;
    bool reachedCap = false;
};

class PathBuilder {
public:
    explicit PathBuilder(const PathConfig& config) : m_config(config) {}

    /**
     * @brief Builds the path.
     * @param embeddings Candidate embeddings (all non-empty).
     * @param conceptSimilarities Score per candidate; the highest one starts the path.
     * @param conceptEmbedding Seed of the rolling centroid; ignored by Hopscotch.
     * @param cap Maximum path length; values <= 0 fall back to PathConfig::maxLength.
     */
    PathResult Build(const std::vector<Embedding>& embeddings,
                     const std::vector<double>& conceptSimilarities,
                     const Embedding& conceptEmbedding,
                     PathVariant variant,
                     int cap = 0) const;

private:
    PathConfig m_config;
};

} // namespace regionwalker::domain::layout
