#include "application/WalkaboutComposer.hpp"
#include "domain/layout/ForceDirectedEmbedder.hpp"
#include "domain/layout/RadiusMapper.hpp"
#include "domain/layout/SimilarityKernel.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <cmath>
#include <algorithm>
#include <iostream>

namespace regionwalker::application {

using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;

double WalkaboutComposer::EaseInOut(double alpha) {
    return alpha < 0.5
        ? 2.0 * alpha * alpha
        : 1.0 - 2.0 * (1.0 - alpha) * (1.0 - alpha);
}

WalkaboutLayout WalkaboutComposer::Compose(const std::vector<Item>& items,
                                           const Position2D& center,
                                           int clusteringLevel,
                                           const std::string& conceptText,
                                           RandomSource& rng) const {
    WalkaboutLayout layout;
    layout.level = ClampClusteringLevel(clusteringLevel);
    layout.alpha = (layout.level - 1) / 3.0;
    layout.easedAlpha = EaseInOut(layout.alpha);

    if (!conceptText.empty()) {
        Card card;
        card.kind = CardKind::Concept;
        card.anchor = center;
        card.width = m_config.canvas.conceptCardWidth;
        card.height = m_config.canvas.conceptCardHeight;
        card.text = conceptText;
        layout.cards.push_back(card);
    }

    const size_t n = items.size();
    if (n == 0) return layout;

    // 1. Radius from similarity to the concept
    std::vector<double> similarities;
    std::vector<Embedding> embeddings;
    similarities.reserve(n);
    embeddings.reserve(n);
    for (const auto& item : items) {
        similarities.push_back(item.conceptSimilarity.value_or(0.0f));
        embeddings.push_back(item.embedding);
    }
    layout.radii = RadiusMapper(m_config.radius).Map(similarities);

    // 2. Angles from the note-to-note layout
    Matrix distances = SimilarityKernel::ToDistanceMatrix(SimilarityKernel::BuildSimilarityMatrix(embeddings));
    std::vector<Position2D> raw = ForceDirectedEmbedder(m_config.force).Embed(distances, rng);
    layout.normalized = LayoutNormalizer(m_config.normalizer).Normalize(raw);

    layout.freePositions.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double angle = layout.normalized.angles[i];
        layout.freePositions.push_back({center.x + layout.radii[i] * std::cos(angle),
                                        center.y + layout.radii[i] * std::sin(angle)});
    }

    // 3. Cluster pull
    ClusterAssigner assigner(m_config.clustering);
    layout.clusters = assigner.Assign(layout.normalized.points, rng);
    layout.clusterAngles = ClusterAssigner::ClusterAngles(layout.clusters, layout.normalized.points);
    layout.clusteredPositions = ClusteredPositions(layout, center);

    // 4. Blend
    const double eased = layout.easedAlpha;
    layout.positions.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const auto& freePos = layout.freePositions[i];
        const auto& clusterPos = layout.clusteredPositions[i];
        layout.positions.push_back({(1.0 - eased) * freePos.x + eased * clusterPos.x,
                                    (1.0 - eased) * freePos.y + eased * clusterPos.y});
    }

    std::cout << "[WalkaboutComposer] Placed " << n << " notes (level=" << layout.level
              << ", clusters=" << layout.clusters.k
              << (layout.normalized.swirled ? ", swirl redistributed" : "") << ")" << std::endl;

    // 5. Cluster summaries only at full pull
    if (layout.level == kMaxClusteringLevel) {
        AddClusterSummaryCards(items, center, layout);
    }

    return layout;
}

std::vector<Position2D> WalkaboutComposer::ClusteredPositions(const WalkaboutLayout& layout,
                                                              const Position2D& center) const {
    const auto& wc = m_config.walkabout;
    const auto& rc = m_config.radius;
    const double alpha = layout.alpha;
    const double maxRadialSpread = wc.maxRadialSpread * (1.0 - alpha * wc.radialSpreadDecay);
    const double maxAngularSpread = wc.maxAngularSpread * (1.0 - alpha * wc.angularSpreadDecay);
    const bool midLevel = alpha > wc.midLevelLow && alpha < wc.midLevelHigh;

    const size_t n = layout.radii.size();
    std::vector<Position2D> positions;
    positions.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const int clusterId = layout.clusters.clusterOf[i];
        const auto& mates = layout.clusters.members[clusterId];
        const double clusterAngle = layout.clusterAngles[clusterId].value_or(layout.normalized.angles[i]);
        const double radius = layout.radii[i];

        // Fan cluster mates out evenly instead of stacking them
        double radialOffset = 0.0;
        double angularOffset = 0.0;
        const int memberCount = static_cast<int>(mates.size());
        if (memberCount > 1) {
            const int rank = layout.clusters.rankInCluster(static_cast<int>(i));
            const double radialStep = (2.0 * maxRadialSpread) / (memberCount - 1);
            const double angularStep = (2.0 * maxAngularSpread) / (memberCount - 1);
            radialOffset = -maxRadialSpread + rank * radialStep;
            angularOffset = -maxAngularSpread + rank * angularStep;
        }

        double adjustedRadius = radius + radialOffset;
        if (midLevel) {
            if (radialOffset < 0.0) {
                adjustedRadius = std::max(radius * wc.radiusFloorFactor, radius + radialOffset * wc.inwardPullFactor);
            }
            adjustedRadius = std::max(adjustedRadius, rc.rMin + (rc.rMax - rc.rMin) * wc.minRadialFraction);
        }
        const double finalRadius = std::max(rc.rMin, adjustedRadius);
        const double finalAngle = clusterAngle + angularOffset;

        positions.push_back({center.x + finalRadius * std::cos(finalAngle),
                             center.y + finalRadius * std::sin(finalAngle)});
    }
    return positions;
}

void WalkaboutComposer::AddClusterSummaryCards(const std::vector<Item>& items,
                                               const Position2D& center,
                                               WalkaboutLayout& layout) const {
    const auto& wc = m_config.walkabout;

    for (int c = 0; c < layout.clusters.k; ++c) {
        const auto& mates = layout.clusters.members[c];
        if (mates.size() <= 1 || !layout.clusterAngles[c]) continue;

        std::vector<std::string> sources;
        for (int idx : mates) {
            if (static_cast<int>(sources.size()) >= wc.summarySourceLimit) break;
            std::string excerpt = infrastructure::PromptCatalog::MakeExcerpt(items[idx].excerpt,
                                                                             m_config.canvas.excerptLength);
            if (!excerpt.empty()) sources.push_back(excerpt);
        }
        if (sources.empty()) {
            std::cerr << "[WalkaboutComposer] Cluster " << c << " has no readable excerpts, skipping summary" << std::endl;
            continue;
        }

        double avgRadius = 0.0;
        for (int idx : mates) avgRadius += layout.radii[idx];
        avgRadius /= static_cast<double>(mates.size());

        const double angle = *layout.clusterAngles[c];
        const double cardRadius = avgRadius + wc.summaryCardOffset;

        Card card;
        card.kind = CardKind::ClusterSummary;
        card.clusterId = c;
        card.anchor = {center.x + cardRadius * std::cos(angle), center.y + cardRadius * std::sin(angle)};
        card.width = m_config.canvas.clusterCardWidth;
        card.height = m_config.canvas.clusterCardHeight;
        card.pendingSummary = SummaryRequest{infrastructure::PromptCatalog::GetClusterSummaryPrompt(), sources};
        layout.cards.push_back(card);
    }
}

} // namespace regionwalker::application
