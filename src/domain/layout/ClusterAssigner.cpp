#include "domain/layout/ClusterAssigner.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace regionwalker::domain::layout {

int ClusterAssignment::rankInCluster(int item) const {
    const auto& mates = members[clusterOf[item]];
    auto it = std::find(mates.begin(), mates.end(), item);
    return static_cast<int>(std::distance(mates.begin(), it));
}

int ClusterAssigner::ClusterCount(size_t n) const {
    int perCluster = std::max(1, m_config.itemsPerCluster);
    int wanted = static_cast<int>((n + perCluster - 1) / perCluster);
    return std::min(m_config.maxClusters, std::max(m_config.minClusters, wanted));
}

ClusterAssignment ClusterAssigner::Assign(const std::vector<Position2D>& points, RandomSource& rng) const {
    return Assign(points, ClusterCount(points.size()), rng);
}

ClusterAssignment ClusterAssigner::Assign(const std::vector<Position2D>& points, int k, RandomSource& rng) const {
    ClusterAssignment result;
    const int n = static_cast<int>(points.size());
    if (n == 0 || k <= 0) return result;

    result.k = k;
    result.clusterOf.assign(n, 0);
    result.centroids.reserve(k);
    for (int c = 0; c < k; ++c) {
        result.centroids.push_back(points[rng.nextIndex(n)]);
    }

    const int rounds = std::max(1, m_config.maxIterations);
    for (int iter = 0; iter < rounds; ++iter) {
        result.iterations = iter + 1;

        // Nearest centroid, first minimum wins ties
        result.members.assign(k, {});
        for (int i = 0; i < n; ++i) {
            double best = std::numeric_limits<double>::infinity();
            int nearest = 0;
            for (int c = 0; c < k; ++c) {
                double dx = points[i].x - result.centroids[c].x;
                double dy = points[i].y - result.centroids[c].y;
                double dist = dx * dx + dy * dy;
                if (dist < best) {
                    best = dist;
                    nearest = c;
                }
            }
            result.clusterOf[i] = nearest;
            result.members[nearest].push_back(i);
        }

        bool moved = false;
        for (int c = 0; c < k; ++c) {
            const auto& mates = result.members[c];
            if (mates.empty()) continue;

            double sumX = 0, sumY = 0;
            for (int idx : mates) {
                sumX += points[idx].x;
                sumY += points[idx].y;
            }
            Position2D updated{sumX / mates.size(), sumY / mates.size()};
            if (std::abs(result.centroids[c].x - updated.x) > m_config.convergenceEpsilon ||
                std::abs(result.centroids[c].y - updated.y) > m_config.convergenceEpsilon) {
                moved = true;
            }
            result.centroids[c] = updated;
        }

        if (!moved) break;
    }

    return result;
}

std::vector<std::optional<double>> ClusterAssigner::ClusterAngles(const ClusterAssignment& assignment,
                                                                   const std::vector<Position2D>& points) {
    std::vector<std::optional<double>> angles(assignment.k);
    for (int c = 0; c < assignment.k; ++c) {
        const auto& mates = assignment.members[c];
        if (mates.empty()) continue;

        double sumSin = 0, sumCos = 0;
        for (int idx : mates) {
            double angle = std::atan2(points[idx].y, points[idx].x);
            sumSin += std::sin(angle);
            sumCos += std::cos(angle);
        }
        angles[c] = std::atan2(sumSin / mates.size(), sumCos / mates.size());
    }
    return angles;
}

} // namespace regionwalker::domain::layout
