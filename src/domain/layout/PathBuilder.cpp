#include "domain/layout/PathBuilder.hpp"
#include <algorithm>
#include <limits>

namespace regionwalker::domain::layout {

PathResult PathBuilder::Build(const std::vector<Embedding>& embeddings,
                              const std::vector<double>& conceptSimilarities,
                              const Embedding& conceptEmbedding,
                              PathVariant variant,
                              int cap) const {
    PathResult result;
    const size_t n = std::min(embeddings.size(), conceptSimilarities.size());
    const size_t limit = static_cast<size_t>(cap > 0 ? cap : std::max(0, m_config.maxLength));
    if (n == 0 || limit == 0) return result;

    size_t start = 0;
    for (size_t i = 1; i < n; ++i) {
        if (conceptSimilarities[i] > conceptSimilarities[start]) start = i;
    }

    std::vector<bool> used(n, false);
    std::vector<Embedding> rolling;
    if (!conceptEmbedding.empty()) rolling.push_back(conceptEmbedding);

    auto select = [&](size_t idx) {
        used[idx] = true;
        result.order.push_back(static_cast<int>(idx));
        if (variant == PathVariant::RollingPath) rolling.push_back(embeddings[idx]);
    };
    select(start);

    while (result.order.size() < limit) {
        Embedding reference = variant == PathVariant::Hopscotch
            ? embeddings[result.order.back()]
            : SimilarityKernel::Centroid(rolling);

        double best = -std::numeric_limits<double>::infinity();
        int bestIdx = -1;
        for (size_t i = 0; i < n; ++i) {
            if (used[i]) continue;
            double sim = SimilarityKernel::CosineSimilarity(reference, embeddings[i]);
            if (sim > best) {
                best = sim;
                bestIdx = static_cast<int>(i);
            }
        }

        if (bestIdx < 0 || best < m_config.similarityThreshold) break;
        result.stepSimilarities.push_back(best);
        select(static_cast<size_t>(bestIdx));
    }

    result.reachedCap = result.order.size() >= limit;
    return result;
}

} // namespace regionwalker::domain::layout
