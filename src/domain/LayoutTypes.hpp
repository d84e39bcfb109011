/**
 * @file LayoutTypes.hpp
 * @brief Value types exchanged between the caller and the layout engine.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cmath>
#include <cctype>

namespace regionwalker::domain {

/**
 * @struct Position2D
 * @brief A point on the canvas (node center, canvas units).
 */
struct Position2D {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @struct Item
 * @brief A note to be placed, as seen by the layout engine.
 */
struct Item {
    std::string id; ///< Note identifier (usually the vault path).
    std::vector<float> embedding; ///< Empty means "not available yet".
    std::optional<float> conceptSimilarity; ///< Computed from the concept embedding when absent.
    std::string excerpt; ///< Source text handed to the summarizer.
};

/**
 * @enum LayoutMode
 * @brief Arrangement strategy selected for one invocation.
 */
enum class LayoutMode {
    Walkabout,
    Hopscotch,
    RollingPath,
    Regiment,
    Gaggle
};

inline std::string LayoutModeToString(LayoutMode mode) {
    switch (mode) {
        case LayoutMode::Walkabout: return "walkabout";
        case LayoutMode::Hopscotch: return "hopscotch";
        case LayoutMode::RollingPath: return "rolling-path";
        case LayoutMode::Regiment: return "regiment";
        case LayoutMode::Gaggle: return "gaggle";
    }
    return "walkabout";
}

inline std::optional<LayoutMode> LayoutModeFromString(const std::string& value) {
    std::string token;
    for (char ch : value) {
        token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (token == "walkabout") return LayoutMode::Walkabout;
    if (token == "hopscotch") return LayoutMode::Hopscotch;
    if (token == "rolling-path" || token == "rollingpath" || token == "rolling") return LayoutMode::RollingPath;
    if (token == "regiment") return LayoutMode::Regiment;
    if (token == "gaggle") return LayoutMode::Gaggle;
    return std::nullopt;
}

/** @brief Walkabout clustering strength: 1 = no cluster pull, 4 = full pull + summaries. */
constexpr int kMinClusteringLevel = 1;
constexpr int kMaxClusteringLevel = 4;

inline int ClampClusteringLevel(int level) {
    return std::min(kMaxClusteringLevel, std::max(kMinClusteringLevel, level));
}

/**
 * @brief Converts the 25/50/75/100 clustering slider into a level.
 */
inline int ClusteringLevelFromPercent(double percent) {
    if (!std::isfinite(percent)) return kMinClusteringLevel;
    percent = std::min(100.0, std::max(0.0, percent));
    return ClampClusteringLevel(static_cast<int>(std::floor((percent - 25.0) / 25.0)) + 1);
}

/**
 * @enum CardKind
 * @brief Role of an auxiliary text card on the canvas.
 */
enum class CardKind {
    Concept,
    ClusterSummary,
    PathSummary
};

inline std::string CardKindToString(CardKind kind) {
    switch (kind) {
        case CardKind::Concept: return "concept";
        case CardKind::ClusterSummary: return "cluster-summary";
        case CardKind::PathSummary: return "path-summary";
    }
    return "concept";
}

/**
 * @struct SummaryRequest
 * @brief Text still to be produced by the summarizer for a card.
 */
struct SummaryRequest {
    std::string prompt;
    std::vector<std::string> sourceTexts;
};

/**
 * @struct Card
 * @brief Auxiliary text node anchored on the canvas.
 */
struct Card {
    CardKind kind = CardKind::Concept;
    Position2D anchor; ///< Card center.
    double width = 0.0;
    double height = 0.0;
    std::string text;
    std::optional<SummaryRequest> pendingSummary; ///< Set until the text is filled.
    int clusterId = -1; ///< Owning cluster for ClusterSummary cards.
};

/**
 * @enum PlacementOutcome
 * @brief How a Gaggle position was obtained.
 */
enum class PlacementOutcome {
    Strict,    ///< Found within the strict budget and bounds.
    Relaxed,   ///< Found after expanding radius and jitter.
    BestEffort ///< Accepted although it violates spacing or bounds.
};

/**
 * @struct PlacedItem
 * @brief Final position of one item.
 */
struct PlacedItem {
    std::string id;
    Position2D position;
    PlacementOutcome outcome = PlacementOutcome::Strict;
};

/**
 * @struct LayoutResult
 * @brief Output of one layout invocation.
 */
struct LayoutResult {
    LayoutMode mode = LayoutMode::Walkabout; ///< Mode actually used (differs on fallback).
    std::vector<PlacedItem> items; ///< Ordered: path order or similarity order.
    std::vector<Card> cards;

    const PlacedItem* find(const std::string& id) const {
        for (const auto& item : items) {
            if (item.id == id) return &item;
        }
        return nullptr;
    }
};

/**
 * @struct LayoutRequest
 * @brief Everything one layout invocation needs.
 */
struct LayoutRequest {
    std::vector<Item> items;
    std::vector<float> conceptEmbedding; ///< Empty: embedded from conceptText when a source is available.
    std::string conceptText;
    LayoutMode mode = LayoutMode::Walkabout;
    int clusteringLevel = kMinClusteringLevel;
    int pathCap = 0; ///< <= 0 uses the configured maximum path length.
    Position2D center;
    bool generateSummaries = true; ///< false leaves summary cards pending.
};

} // namespace regionwalker::domain
