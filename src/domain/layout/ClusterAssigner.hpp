/**
 * @file ClusterAssigner.hpp
 * @brief k-means partitioning of the normalized 2D layout.
 */

#pragma once
#include <vector>
#include <optional>
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/RandomSource.hpp"

namespace regionwalker::domain::layout {

/**
 * @struct ClusterAssignment
 * @brief Result of k-means: every item belongs to exactly one cluster.
 */
struct ClusterAssignment {
    int k = 0;
    std::vector<int> clusterOf;             ///< Cluster id per item.
    std::vector<std::vector<int>> members;  ///< Item indices per cluster, ascending. May be empty.
    std::vector<Position2D> centroids;
    int iterations = 0;

    /** @brief Position of an item among its cluster mates. */
    int rankInCluster(int item) const;
};

/**
 * @class ClusterAssigner
 * @brief Lloyd iterations with random-sample seeding; empty clusters are not reseeded.
 */
class ClusterAssigner {
public:
    explicit ClusterAssigner(const ClusteringConfig& config) : m_config(config) {}

    /** @brief clamp(minClusters, maxClusters) of ceil(n / itemsPerCluster). */
    int ClusterCount(size_t n) const;

    /** @brief Runs k-means with ClusterCount(points.size()) clusters. */
    ClusterAssignment Assign(const std::vector<Position2D>& points, RandomSource& rng) const;

    /** @brief Runs k-means with an explicit k. */
    ClusterAssignment Assign(const std::vector<Position2D>& points, int k, RandomSource& rng) const;

    /**
     * @brief Circular mean of the members' angles around the origin.
     * @return One entry per cluster; std::nullopt for empty clusters.
     */
    static std::vector<std::optional<double>> ClusterAngles(const ClusterAssignment& assignment,
                                                            const std::vector<Position2D>& points);

private:
    ClusteringConfig m_config;
};

} // namespace regionwalker::domain::layout
