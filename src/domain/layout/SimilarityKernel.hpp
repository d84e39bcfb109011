/**
 * @file SimilarityKernel.hpp
 * @brief Vector similarity primitives shared by every layout mode.
 */

#pragma once
#include <vector>

namespace regionwalker::domain::layout {

using Embedding = std::vector<float>;
using Matrix = std::vector<std::vector<double>>;

class SimilarityKernel {
public:
    /**
     * @brief Cosine similarity of two vectors.
     * @return 0 when either vector is empty, has zero magnitude, or sizes differ.
     */
    static double CosineSimilarity(const Embedding& a, const Embedding& b);

    /**
     * @brief Elementwise mean. Vectors whose size differs from the first are ignored.
     * @return Empty vector when there is nothing to average (no valid center).
     */
    static Embedding Centroid(const std::vector<Embedding>& vectors);

    /** @brief Pairwise cosine similarities; symmetric with a diagonal of exactly 1. */
    static Matrix BuildSimilarityMatrix(const std::vector<Embedding>& embeddings);

    /** @brief Elementwise 1 - similarity. */
    static Matrix ToDistanceMatrix(const Matrix& similarity);
};

} // namespace regionwalker::domain::layout
