#include "application/CrowdComposer.hpp"
#include <iostream>

namespace regionwalker::application {

using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;

Position2D CrowdComposer::CrowdOrigin(const Position2D& center) const {
    return {center.x, center.y + m_config.canvas.crowdOffsetY};
}

CrowdLayout CrowdComposer::Compose(size_t count,
                                   CrowdFormation formation,
                                   const std::string& conceptText,
                                   const Position2D& center,
                                   RandomSource& rng) const {
    CrowdLayout layout;
    const auto& canvas = m_config.canvas;

    if (!conceptText.empty()) {
        Card card;
        card.kind = CardKind::Concept;
        card.anchor = {center.x, center.y - canvas.conceptCardRaise};
        card.width = canvas.conceptCardWidth;
        card.height = canvas.conceptCardHeight;
        card.text = conceptText;
        layout.cards.push_back(card);
    }

    CrowdPlacer placer(m_config.canvas, m_config.regiment, m_config.gaggle);
    const Position2D origin = CrowdOrigin(center);

    if (formation == CrowdFormation::Regiment) {
        for (const auto& cell : placer.Regiment(count, origin)) {
            layout.points.push_back({cell, PlacementOutcome::Strict});
        }
        std::cout << "[CrowdComposer] Regiment: " << count << " notes in "
                  << CrowdPlacer::RegimentColumns(count) << " columns" << std::endl;
        return layout;
    }

    layout.points = placer.Gaggle(count, origin, rng);

    int relaxed = 0;
    int bestEffort = 0;
    for (const auto& point : layout.points) {
        if (point.outcome == PlacementOutcome::Relaxed) ++relaxed;
        if (point.outcome == PlacementOutcome::BestEffort) ++bestEffort;
    }
    std::cout << "[CrowdComposer] Gaggle: placed " << count << " notes (relaxed=" << relaxed
              << ", best-effort=" << bestEffort << ")" << std::endl;
    if (bestEffort > 0) {
        std::cerr << "[CrowdComposer] Warning: " << bestEffort
                  << " notes could not be placed without overlap" << std::endl;
    }
    return layout;
}

} // namespace regionwalker::application
