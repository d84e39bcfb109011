#include "infrastructure/LayoutJsonCodec.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>

namespace regionwalker::infrastructure {

using json = nlohmann::json;
using namespace regionwalker::domain;

namespace {

std::optional<std::vector<float>> ReadVector(const json& value) {
    if (!value.is_array()) return std::nullopt;
    std::vector<float> vec;
    vec.reserve(value.size());
    for (const auto& element : value) {
        if (!element.is_number()) return std::nullopt;
        const double component = element.get<double>();
        if (!std::isfinite(component) || std::fabs(component) > std::numeric_limits<float>::max()) {
            return std::nullopt;
        }
        vec.push_back(static_cast<float>(component));
    }
    return vec;
}

// Integer field given as any JSON number. Values an int cannot hold are logged and ignored.
std::optional<int> ReadInt(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
    const double value = j[key].get<double>();
    if (!std::isfinite(value) || value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        std::cerr << "[LayoutJsonCodec] Ignoring '" << key << "': " << j[key].dump() << " is out of range" << std::endl;
        return std::nullopt;
    }
    return static_cast<int>(std::floor(value));
}

} // namespace

std::string LayoutJsonCodec::PlacementToString(PlacementOutcome outcome) {
    switch (outcome) {
        case PlacementOutcome::Strict: return "strict";
        case PlacementOutcome::Relaxed: return "relaxed";
        case PlacementOutcome::BestEffort: return "best-effort";
    }
    return "strict";
}

std::optional<LayoutRequest> LayoutJsonCodec::DecodeRequest(const json& j) {
    if (!j.is_object()) {
        std::cerr << "[LayoutJsonCodec] Request must be a JSON object" << std::endl;
        return std::nullopt;
    }
    if (!j.contains("items") || !j["items"].is_array()) {
        std::cerr << "[LayoutJsonCodec] Request has no 'items' array" << std::endl;
        return std::nullopt;
    }

    LayoutRequest request;

    if (j.contains("concept")) {
        const auto& conceptJson = j["concept"];
        if (conceptJson.is_string()) {
            request.conceptText = conceptJson.get<std::string>();
        } else if (conceptJson.is_object()) {
            if (conceptJson.contains("text") && conceptJson["text"].is_string()) {
                request.conceptText = conceptJson["text"].get<std::string>();
            }
            if (conceptJson.contains("embedding")) {
                if (auto vec = ReadVector(conceptJson["embedding"])) {
                    request.conceptEmbedding = std::move(*vec);
                } else {
                    std::cerr << "[LayoutJsonCodec] Ignoring malformed concept embedding" << std::endl;
                }
            }
        }
    }

    if (j.contains("mode")) {
        auto mode = j["mode"].is_string() ? LayoutModeFromString(j["mode"].get<std::string>()) : std::nullopt;
        if (!mode) {
            std::cerr << "[LayoutJsonCodec] Unknown layout mode: " << j["mode"].dump() << std::endl;
            return std::nullopt;
        }
        request.mode = *mode;
    }

    if (auto level = ReadInt(j, "clustering")) {
        request.clusteringLevel = ClampClusteringLevel(*level);
    } else if (j.contains("clusteringPercent") && j["clusteringPercent"].is_number()) {
        request.clusteringLevel = ClusteringLevelFromPercent(j["clusteringPercent"].get<double>());
    }

    if (auto cap = ReadInt(j, "pathCap")) {
        request.pathCap = *cap;
    }

    if (j.contains("center") && j["center"].is_object()) {
        const auto& center = j["center"];
        if (center.contains("x") && center["x"].is_number()) request.center.x = center["x"].get<double>();
        if (center.contains("y") && center["y"].is_number()) request.center.y = center["y"].get<double>();
    }

    for (const auto& entry : j["items"]) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            std::cerr << "[LayoutJsonCodec] Every item needs a string 'id'" << std::endl;
            return std::nullopt;
        }
        Item item;
        item.id = entry["id"].get<std::string>();
        if (entry.contains("embedding")) {
            if (auto vec = ReadVector(entry["embedding"])) {
                item.embedding = std::move(*vec);
            } else {
                std::cerr << "[LayoutJsonCodec] Ignoring malformed embedding of " << item.id << std::endl;
            }
        }
        if (entry.contains("similarity") && entry["similarity"].is_number()) {
            const double similarity = entry["similarity"].get<double>();
            if (std::isfinite(similarity)) {
                item.conceptSimilarity = static_cast<float>(std::min(1.0, std::max(-1.0, similarity)));
            } else {
                std::cerr << "[LayoutJsonCodec] Ignoring non-finite similarity of " << item.id << std::endl;
            }
        }
        if (entry.contains("excerpt") && entry["excerpt"].is_string()) {
            item.excerpt = entry["excerpt"].get<std::string>();
        }
        request.items.push_back(std::move(item));
    }

    return request;
}

std::optional<LayoutRequest> LayoutJsonCodec::ReadRequestFile(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[LayoutJsonCodec] Cannot open " << path << std::endl;
        return std::nullopt;
    }
    try {
        return DecodeRequest(json::parse(f));
    } catch (const std::exception& e) {
        std::cerr << "[LayoutJsonCodec] Error parsing " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

json LayoutJsonCodec::EncodeResult(const LayoutResult& result) {
    json positions = json::array();
    for (const auto& item : result.items) {
        positions.push_back({
            {"id", item.id},
            {"x", item.position.x},
            {"y", item.position.y},
            {"placement", PlacementToString(item.outcome)}
        });
    }

    json cards = json::array();
    for (const auto& card : result.cards) {
        json entry = {
            {"kind", CardKindToString(card.kind)},
            {"x", card.anchor.x},
            {"y", card.anchor.y},
            {"width", card.width},
            {"height", card.height},
            {"text", card.text}
        };
        if (card.clusterId >= 0) {
            entry["cluster"] = card.clusterId;
        }
        if (card.pendingSummary) {
            entry["pending"] = {
                {"prompt", card.pendingSummary->prompt},
                {"sources", card.pendingSummary->sourceTexts}
            };
        }
        cards.push_back(std::move(entry));
    }

    return {
        {"mode", LayoutModeToString(result.mode)},
        {"positions", std::move(positions)},
        {"cards", std::move(cards)}
    };
}

} // namespace regionwalker::infrastructure
