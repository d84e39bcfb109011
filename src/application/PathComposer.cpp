#include "application/PathComposer.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <iostream>

namespace regionwalker::application {

using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;

Position2D PathComposer::StepPosition(const Position2D& center, size_t index) const {
    const auto& canvas = m_config.canvas;
    const double spacing = m_config.path.stepSpacing;
    const double stepX = canvas.noteWidth + spacing;
    const double stepY = canvas.noteHeight + spacing;
    return {center.x + spacing + static_cast<double>(index) * stepX,
            center.y + static_cast<double>(index) * stepY};
}

PathLayout PathComposer::Compose(const std::vector<Item>& items,
                                 const std::vector<float>& conceptEmbedding,
                                 const std::string& conceptText,
                                 PathVariant variant,
                                 int cap,
                                 const Position2D& center) const {
    PathLayout layout;
    const auto& canvas = m_config.canvas;
    const double spacing = m_config.path.stepSpacing;

    std::vector<Embedding> embeddings;
    std::vector<double> similarities;
    embeddings.reserve(items.size());
    similarities.reserve(items.size());
    for (const auto& item : items) {
        embeddings.push_back(item.embedding);
        similarities.push_back(item.conceptSimilarity.value_or(0.0f));
    }

    layout.path = PathBuilder(m_config.path).Build(embeddings, similarities, conceptEmbedding, variant, cap);

    const Position2D first = StepPosition(center, 0);
    if (!conceptText.empty()) {
        Card card;
        card.kind = CardKind::Concept;
        card.width = canvas.conceptCardWidth;
        card.height = canvas.conceptCardHeight;
        card.anchor = {first.x - spacing - card.width / 2.0, first.y - spacing - card.height / 2.0};
        card.text = conceptText;
        layout.cards.push_back(card);
    }

    for (size_t i = 0; i < layout.path.order.size(); ++i) {
        layout.positions.push_back(StepPosition(center, i));
    }

    const char* variantName = variant == PathVariant::Hopscotch ? "Hopscotch" : "Rolling Path";
    std::cout << "[PathComposer] " << variantName << " selected " << layout.path.order.size()
              << " of " << items.size() << " notes"
              << (layout.path.reachedCap ? " (length cap reached)" : "") << std::endl;

    if (layout.path.order.empty()) return layout;

    std::vector<std::string> sources;
    for (int idx : layout.path.order) {
        if (static_cast<int>(sources.size()) >= m_config.path.summarySourceLimit) break;
        std::string excerpt = infrastructure::PromptCatalog::MakeExcerpt(items[idx].excerpt, canvas.excerptLength);
        if (!excerpt.empty()) sources.push_back(excerpt);
    }
    if (sources.empty()) {
        std::cerr << "[PathComposer] No readable excerpts on the path, skipping summary card" << std::endl;
        return layout;
    }

    Card summary;
    summary.kind = CardKind::PathSummary;
    summary.anchor = StepPosition(center, layout.path.order.size());
    summary.width = canvas.conceptCardWidth;
    summary.height = canvas.conceptCardHeight;
    summary.pendingSummary = SummaryRequest{infrastructure::PromptCatalog::GetPathSummaryPrompt(conceptText), sources};
    layout.cards.push_back(summary);

    return layout;
}

} // namespace regionwalker::application
