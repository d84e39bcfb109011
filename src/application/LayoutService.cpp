#include "application/LayoutService.hpp"
#include "application/CrowdComposer.hpp"
#include "application/PathComposer.hpp"
#include "application/WalkaboutComposer.hpp"
#include "domain/layout/SimilarityKernel.hpp"
#include "infrastructure/SummaryCleaner.hpp"
#include <algorithm>
#include <iostream>

namespace regionwalker::application {

using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;

LayoutService::LayoutService(const LayoutConfig& config,
                             std::shared_ptr<EmbeddingSource> embeddings,
                             std::shared_ptr<Summarizer> summarizer,
                             std::shared_ptr<AsyncTaskManager> taskManager)
    : m_config(config),
      m_embeddings(std::move(embeddings)),
      m_summarizer(std::move(summarizer)),
      m_taskManager(std::move(taskManager)) {}

LayoutService::ResolvedItems LayoutService::Resolve(const LayoutRequest& request) const {
    ResolvedItems resolved;
    resolved.conceptEmbedding = request.conceptEmbedding;

    if (resolved.conceptEmbedding.empty() && m_embeddings && !request.conceptText.empty()) {
        try {
            if (auto embedded = m_embeddings->embedText(request.conceptText)) {
                resolved.conceptEmbedding = std::move(*embedded);
            }
        } catch (const std::exception& e) {
            std::cerr << "[LayoutService] Concept embedding failed: " << e.what() << std::endl;
        }
    }

    size_t dimension = resolved.conceptEmbedding.size();
    int fetched = 0;

    for (const auto& input : request.items) {
        Item item = input;

        if (item.embedding.empty() && m_embeddings) {
            try {
                if (auto embedding = m_embeddings->fetchEmbedding(item.id)) {
                    item.embedding = std::move(*embedding);
                    ++fetched;
                }
            } catch (const std::exception& e) {
                std::cerr << "[LayoutService] Embedding fetch failed for " << item.id << ": " << e.what() << std::endl;
            }
        }

        if (item.embedding.empty()) {
            std::cerr << "[LayoutService] Skipping " << item.id << ": no embedding" << std::endl;
            resolved.unplaceable.push_back(std::move(item));
            continue;
        }
        if (dimension == 0) {
            dimension = item.embedding.size();
        } else if (item.embedding.size() != dimension) {
            std::cerr << "[LayoutService] Skipping " << item.id << ": embedding has " << item.embedding.size()
                      << " dimensions, expected " << dimension << std::endl;
            resolved.unplaceable.push_back(std::move(item));
            continue;
        }

        if (!item.conceptSimilarity) {
            if (resolved.conceptEmbedding.empty()) {
                std::cerr << "[LayoutService] Skipping " << item.id << ": no concept similarity" << std::endl;
                resolved.unplaceable.push_back(std::move(item));
                continue;
            }
            item.conceptSimilarity = static_cast<float>(
                SimilarityKernel::CosineSimilarity(resolved.conceptEmbedding, item.embedding));
        }
        resolved.placeable.push_back(std::move(item));
    }

    std::stable_sort(resolved.placeable.begin(), resolved.placeable.end(),
                     [](const Item& a, const Item& b) { return *a.conceptSimilarity > *b.conceptSimilarity; });

    if (fetched > 0) {
        std::cout << "[LayoutService] Fetched " << fetched << " embeddings" << std::endl;
    }
    return resolved;
}

std::optional<LayoutResult> LayoutService::Arrange(const LayoutRequest& request,
                                                   RandomSource& rng,
                                                   ProgressCallback progress) const {
    auto report = [&progress](float value) {
        if (progress) progress(value);
    };

    if (request.items.empty()) {
        std::cerr << "[LayoutService] Nothing to arrange: request has no items" << std::endl;
        return std::nullopt;
    }

    report(0.05f);
    ResolvedItems resolved = Resolve(request);
    report(0.3f);

    std::cout << "[LayoutService] Arranging " << resolved.placeable.size() << " of " << request.items.size()
              << " notes as " << LayoutModeToString(request.mode) << std::endl;

    LayoutResult result;
    const bool crowd = request.mode == LayoutMode::Regiment || request.mode == LayoutMode::Gaggle;

    if (crowd) {
        // Crowds do not need embeddings; ranked notes go first
        std::vector<Item> everyone = resolved.placeable;
        everyone.insert(everyone.end(), resolved.unplaceable.begin(), resolved.unplaceable.end());
        result = ArrangeCrowd(request, request.mode, everyone, rng);
    } else if (resolved.placeable.empty()) {
        std::cerr << "[LayoutService] No note could be ranked against the concept; falling back to a regiment grid"
                  << std::endl;
        result = ArrangeCrowd(request, LayoutMode::Regiment, resolved.unplaceable, rng);
    } else if (request.mode == LayoutMode::Walkabout) {
        result = ArrangeWalkabout(request, resolved, rng);
    } else {
        result = ArrangePath(request, resolved);
    }
    report(0.7f);

    if (request.generateSummaries) {
        FillSummaries(result);
    }
    report(1.0f);
    return result;
}

LayoutResult LayoutService::ArrangeWalkabout(const LayoutRequest& request,
                                             const ResolvedItems& resolved,
                                             RandomSource& rng) const {
    WalkaboutComposer composer(m_config);
    WalkaboutLayout layout = composer.Compose(resolved.placeable, request.center, request.clusteringLevel,
                                              request.conceptText, rng);

    LayoutResult result;
    result.mode = LayoutMode::Walkabout;
    for (size_t i = 0; i < resolved.placeable.size(); ++i) {
        result.items.push_back({resolved.placeable[i].id, layout.positions[i], PlacementOutcome::Strict});
    }
    result.cards = std::move(layout.cards);
    return result;
}

LayoutResult LayoutService::ArrangePath(const LayoutRequest& request, const ResolvedItems& resolved) const {
    const PathVariant variant = request.mode == LayoutMode::Hopscotch ? PathVariant::Hopscotch
                                                                      : PathVariant::RollingPath;
    PathComposer composer(m_config);
    PathLayout layout = composer.Compose(resolved.placeable, resolved.conceptEmbedding, request.conceptText,
                                         variant, request.pathCap, request.center);

    LayoutResult result;
    result.mode = request.mode;
    for (size_t i = 0; i < layout.path.order.size(); ++i) {
        result.items.push_back({resolved.placeable[layout.path.order[i]].id, layout.positions[i],
                                PlacementOutcome::Strict});
    }
    result.cards = std::move(layout.cards);
    return result;
}

LayoutResult LayoutService::ArrangeCrowd(const LayoutRequest& request,
                                         LayoutMode mode,
                                         const std::vector<Item>& items,
                                         RandomSource& rng) const {
    const CrowdFormation formation = mode == LayoutMode::Gaggle ? CrowdFormation::Gaggle : CrowdFormation::Regiment;
    CrowdComposer composer(m_config);
    CrowdLayout layout = composer.Compose(items.size(), formation, request.conceptText, request.center, rng);

    LayoutResult result;
    result.mode = mode;
    for (size_t i = 0; i < items.size(); ++i) {
        result.items.push_back({items[i].id, layout.points[i].position, layout.points[i].outcome});
    }
    result.cards = std::move(layout.cards);
    return result;
}

void LayoutService::FillSummaries(LayoutResult& result) const {
    std::vector<Card> kept;
    kept.reserve(result.cards.size());

    for (auto& card : result.cards) {
        if (!card.pendingSummary) {
            kept.push_back(std::move(card));
            continue;
        }
        if (!m_summarizer) {
            std::cerr << "[LayoutService] No summarizer configured; dropping " << CardKindToString(card.kind)
                      << " card" << std::endl;
            continue;
        }

        std::optional<std::string> summary;
        try {
            summary = m_summarizer->summarize(card.pendingSummary->prompt, card.pendingSummary->sourceTexts);
        } catch (const std::exception& e) {
            std::cerr << "[LayoutService] Summarizer failed: " << e.what() << std::endl;
        }

        std::string text = summary ? infrastructure::SummaryCleaner::Trim(*summary) : std::string();
        if (text.empty()) {
            std::cerr << "[LayoutService] No summary for " << CardKindToString(card.kind) << " card; omitting it"
                      << std::endl;
            continue;
        }
        card.text = std::move(text);
        card.pendingSummary.reset();
        kept.push_back(std::move(card));
    }

    result.cards = std::move(kept);
}

std::shared_ptr<TaskStatus> LayoutService::ArrangeAsync(LayoutRequest request, std::uint64_t seed, ResultCallback onDone) {
    if (!m_taskManager) {
        std::cerr << "[LayoutService] ArrangeAsync called without a task manager" << std::endl;
        return nullptr;
    }

    const std::string description = "Layout " + LayoutModeToString(request.mode) + " (" +
                                    std::to_string(request.items.size()) + " notes)";

    // The worker owns a copy of the config and collaborators; this service may be gone before it runs.
    const LayoutService worker(m_config, m_embeddings, m_summarizer);
    return m_taskManager->SubmitTask(TaskType::Layout, description,
        [worker, seed](std::shared_ptr<TaskStatus> status, LayoutRequest req, ResultCallback callback) {
            MersenneRandomSource rng(seed);
            auto result = worker.Arrange(req, rng, [status](float p) { status->progress = p; });
            if (callback) callback(std::move(result));
        },
        std::move(request), std::move(onDone));
}

} // namespace regionwalker::application
