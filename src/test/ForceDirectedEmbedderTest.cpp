#include <cassert>
#include <iostream>

#include "domain/layout/ForceDirectedEmbedder.hpp"
#include "TestSupport.hpp"

using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;
using regionwalker::test::Distance;
using regionwalker::test::Near;

int main() {
    std::cout << "[Test] Starting ForceDirectedEmbedder Test..." << std::endl;

    ForceConfig config;
    ForceDirectedEmbedder embedder(config);
    MersenneRandomSource rng(7);

    assert(embedder.Embed({}, rng).empty() && "No items, no points");
    auto single = embedder.Embed({{0.0}}, rng);
    assert(single.size() == 1 && Near(single[0], {config.initialRadius, 0.0}) &&
           "A single item stays at its start position");
    std::cout << "[PASS] Trivial sizes." << std::endl;

    auto circle = embedder.InitialLayout(4, rng);
    assert(Near(circle[0], {100.0, 0.0}) && "First point on the positive x axis");
    assert(Near(circle[1], {0.0, 100.0}) && "Quarter turn");
    assert(Near(circle[2], {-100.0, 0.0}) && "Half turn");
    std::cout << "[PASS] Start circle." << std::endl;

    // Two tight pairs: {0,1} and {2,3}
    std::vector<Embedding> embeddings = {
        {1.0f, 0.05f, 0.0f}, {0.98f, 0.0f, 0.05f}, {0.0f, 1.0f, 0.05f}, {0.05f, 0.97f, 0.0f}
    };
    Matrix distances = SimilarityKernel::ToDistanceMatrix(SimilarityKernel::BuildSimilarityMatrix(embeddings));
    auto layout = embedder.Embed(distances, rng);
    assert(layout.size() == 4 && "One point per item");
    for (const auto& p : layout) {
        assert(std::isfinite(p.x) && std::isfinite(p.y) && "Coordinates stay finite");
    }

    double within = (Distance(layout[0], layout[1]) + Distance(layout[2], layout[3])) / 2.0;
    double across = (Distance(layout[0], layout[2]) + Distance(layout[1], layout[3])) / 2.0;
    assert(within < across && "Similar items end up closer than dissimilar ones");

    auto again = embedder.Embed(distances, rng);
    for (size_t i = 0; i < layout.size(); ++i) {
        assert(Near(layout[i], again[i]) && "Without jitter the relaxation is deterministic");
    }
    std::cout << "[PASS] Spring relaxation." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
