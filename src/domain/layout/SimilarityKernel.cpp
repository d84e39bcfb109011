#include "domain/layout/SimilarityKernel.hpp"
#include <cmath>

namespace regionwalker::domain::layout {

double SimilarityKernel::CosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    double dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        n1 += static_cast<double>(a[i]) * a[i];
        n2 += static_cast<double>(b[i]) * b[i];
    }
    double norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0;
}

Embedding SimilarityKernel::Centroid(const std::vector<Embedding>& vectors) {
    if (vectors.empty() || vectors.front().empty()) return {};

    const size_t dimension = vectors.front().size();
    std::vector<double> sum(dimension, 0.0);
    size_t counted = 0;
    for (const auto& v : vectors) {
        if (v.size() != dimension) continue;
        for (size_t i = 0; i < dimension; ++i) {
            sum[i] += v[i];
        }
        ++counted;
    }

    Embedding centroid(dimension);
    for (size_t i = 0; i < dimension; ++i) {
        centroid[i] = static_cast<float>(sum[i] / static_cast<double>(counted));
    }
    return centroid;
}

Matrix SimilarityKernel::BuildSimilarityMatrix(const std::vector<Embedding>& embeddings) {
    const size_t n = embeddings.size();
    Matrix matrix(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        matrix[i][i] = 1.0;
        for (size_t j = i + 1; j < n; ++j) {
            double sim = CosineSimilarity(embeddings[i], embeddings[j]);
            matrix[i][j] = sim;
            matrix[j][i] = sim;
        }
    }
    return matrix;
}

Matrix SimilarityKernel::ToDistanceMatrix(const Matrix& similarity) {
    Matrix distance = similarity;
    for (auto& row : distance) {
        for (auto& value : row) {
            value = 1.0 - value;
        }
    }
    return distance;
}

} // namespace regionwalker::domain::layout
