/**
 * @file TestSupport.hpp
 * @brief In-memory collaborators and small geometry helpers shared by the tests.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/EmbeddingSource.hpp"
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/Summarizer.hpp"

namespace regionwalker::test {

inline bool Near(double a, double b, double tolerance = 1e-6) {
    return std::abs(a - b) <= tolerance;
}

inline bool Near(const domain::Position2D& a, const domain::Position2D& b, double tolerance = 1e-6) {
    return Near(a.x, b.x, tolerance) && Near(a.y, b.y, tolerance);
}

inline double Distance(const domain::Position2D& a, const domain::Position2D& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

inline double AngleAround(const domain::Position2D& p, const domain::Position2D& center) {
    return std::atan2(p.y - center.y, p.x - center.x);
}

/** @brief Absolute angular difference in [0, pi]. */
inline double AngularDistance(double a, double b) {
    double d = std::fmod(std::abs(a - b), 2.0 * domain::kPi);
    return d > domain::kPi ? 2.0 * domain::kPi - d : d;
}

/** @brief Width of the smallest arc that contains every angle. */
inline double ArcSpan(std::vector<double> angles) {
    if (angles.size() < 2) return 0.0;
    for (auto& a : angles) {
        a = std::fmod(a, 2.0 * domain::kPi);
        if (a < 0) a += 2.0 * domain::kPi;
    }
    std::sort(angles.begin(), angles.end());
    double maxGap = angles.front() + 2.0 * domain::kPi - angles.back();
    for (size_t i = 0; i + 1 < angles.size(); ++i) {
        maxGap = std::max(maxGap, angles[i + 1] - angles[i]);
    }
    return 2.0 * domain::kPi - maxGap;
}

/** @brief Serves embeddings from a map; unknown ids are absent. */
class StubEmbeddingSource : public domain::EmbeddingSource {
public:
    std::map<std::string, std::vector<float>> vectors;
    std::map<std::string, std::vector<float>> texts;
    std::atomic<int> fetchCalls{0};

    std::optional<std::vector<float>> fetchEmbedding(const std::string& itemId) override {
        ++fetchCalls;
        auto it = vectors.find(itemId);
        if (it == vectors.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::vector<float>> embedText(const std::string& text) override {
        auto it = texts.find(text);
        if (it == texts.end()) return std::nullopt;
        return it->second;
    }
};

/** @brief Returns a canned reply, or nothing / an exception when told to fail. */
class StubSummarizer : public domain::Summarizer {
public:
    std::string reply = "Notes about the concept.";
    bool fail = false;
    bool throwOnCall = false;
    std::atomic<int> calls{0};
    std::vector<std::string> prompts;

    std::optional<std::string> summarize(const std::string& prompt,
                                         const std::vector<std::string>& sourceTexts) override {
        ++calls;
        if (throwOnCall) throw std::runtime_error("model server unreachable");
        if (fail || sourceTexts.empty()) return std::nullopt;
        prompts.push_back(prompt);
        return reply;
    }
};

/** @brief A note with an explicit embedding and similarity. */
inline domain::Item MakeItem(const std::string& id, std::vector<float> embedding,
                             std::optional<float> similarity = std::nullopt,
                             const std::string& excerpt = "") {
    domain::Item item;
    item.id = id;
    item.embedding = std::move(embedding);
    item.conceptSimilarity = similarity;
    item.excerpt = excerpt.empty() ? ("Body of " + id) : excerpt;
    return item;
}

/** @brief Two tight groups of three: {A,B,C} near the first axis, {D,E,F} near the second. */
inline std::vector<domain::Item> TwoGroupItems() {
    return {
        MakeItem("A", {1.00f, 0.05f, 0.00f, 0.02f}, 0.50f),
        MakeItem("B", {0.98f, 0.00f, 0.06f, 0.00f}, 0.55f),
        MakeItem("C", {0.97f, 0.04f, 0.03f, 0.05f}, 0.60f),
        MakeItem("D", {0.02f, 1.00f, 0.05f, 0.00f}, 0.52f),
        MakeItem("E", {0.00f, 0.97f, 0.00f, 0.06f}, 0.57f),
        MakeItem("F", {0.05f, 0.98f, 0.04f, 0.03f}, 0.58f),
    };
}

} // namespace regionwalker::test
