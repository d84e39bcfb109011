/**
 * @file LayoutService.hpp
 * @brief Entry point of the layout engine: resolves inputs, dispatches a mode, fills summary cards.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "domain/EmbeddingSource.hpp"
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/RandomSource.hpp"
#include "domain/Summarizer.hpp"

namespace regionwalker::application {

/**
 * @class LayoutService
 * @brief Runs one layout per call; holds no per-invocation state.
 *
 * Reentrant as long as concurrent calls use distinct RandomSource instances
 * and the injected collaborators are thread-safe.
 */
class LayoutService {
public:
    using ProgressCallback = std::function<void(float)>;
    using ResultCallback = std::function<void(std::optional<domain::LayoutResult>)>;

    LayoutService(const domain::LayoutConfig& config,
                  std::shared_ptr<domain::EmbeddingSource> embeddings = nullptr,
                  std::shared_ptr<domain::Summarizer> summarizer = nullptr,
                  std::shared_ptr<AsyncTaskManager> taskManager = nullptr);

    /**
     * @brief Computes a layout.
     * @return std::nullopt only when the request holds no items at all.
     */
    std::optional<domain::LayoutResult> Arrange(const domain::LayoutRequest& request,
                                                domain::RandomSource& rng,
                                                ProgressCallback progress = nullptr) const;

    /**
     * @brief Runs Arrange on a background thread with its own seeded generator.
     * @return Task status, or nullptr when no task manager was configured.
     */
    std::shared_ptr<TaskStatus> ArrangeAsync(domain::LayoutRequest request, std::uint64_t seed, ResultCallback onDone);

    /**
     * @brief Asks the summarizer for every pending card. Cards whose summary
     * comes back absent (or that have no summarizer) are removed.
     */
    void FillSummaries(domain::LayoutResult& result) const;

    const domain::LayoutConfig& GetConfig() const { return m_config; }

private:
    struct ResolvedItems {
        std::vector<domain::Item> placeable;   ///< Embedding and similarity known, sorted by similarity.
        std::vector<domain::Item> unplaceable; ///< Input order.
        std::vector<float> conceptEmbedding;
    };

    ResolvedItems Resolve(const domain::LayoutRequest& request) const;

    domain::LayoutResult ArrangeWalkabout(const domain::LayoutRequest& request, const ResolvedItems& resolved,
                                          domain::RandomSource& rng) const;
    domain::LayoutResult ArrangePath(const domain::LayoutRequest& request, const ResolvedItems& resolved) const;
    domain::LayoutResult ArrangeCrowd(const domain::LayoutRequest& request, domain::LayoutMode mode,
                                      const std::vector<domain::Item>& items, domain::RandomSource& rng) const;

    domain::LayoutConfig m_config;
    std::shared_ptr<domain::EmbeddingSource> m_embeddings;
    std::shared_ptr<domain::Summarizer> m_summarizer;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
};

} // namespace regionwalker::application
