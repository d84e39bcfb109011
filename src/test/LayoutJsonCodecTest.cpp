#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/LayoutJsonCodec.hpp"

using namespace regionwalker::domain;
using namespace regionwalker::infrastructure;
using json = nlohmann::json;

namespace {

void TestDecode() {
    json request = json::parse(R"({
        "concept": {"text": "Why do we sleep?", "embedding": [1, 0, 0]},
        "mode": "Rolling-Path",
        "clusteringPercent": 75,
        "pathCap": 7,
        "center": {"x": 120.5, "y": -40},
        "items": [
            {"id": "notes/a.md", "embedding": [0.5, 0.5, 0], "similarity": 0.8, "excerpt": "Sleep clears waste."},
            {"id": "notes/b.md", "embedding": "not a vector"},
            {"id": "notes/c.md"}
        ]
    })");

    auto decoded = LayoutJsonCodec::DecodeRequest(request);
    assert(decoded && "Well-formed request decodes");
    assert(decoded->conceptText == "Why do we sleep?" && decoded->conceptEmbedding.size() == 3 && "Concept object");
    assert(decoded->mode == LayoutMode::RollingPath && "Mode names are case-insensitive");
    assert(decoded->clusteringLevel == 3 && "75 percent is level 3");
    assert(decoded->pathCap == 7 && "Path cap");
    assert(decoded->center.x == 120.5 && decoded->center.y == -40.0 && "Center");
    assert(decoded->items.size() == 3 && "Every item kept");
    assert(decoded->items[0].conceptSimilarity && *decoded->items[0].conceptSimilarity == 0.8f && "Similarity");
    assert(decoded->items[0].excerpt == "Sleep clears waste." && "Excerpt");
    assert(decoded->items[1].embedding.empty() && "Malformed embedding is dropped, not fatal");
    assert(!decoded->items[2].conceptSimilarity && "Absent similarity stays absent");
    assert(decoded->generateSummaries && "Summaries on by default");

    auto minimal = LayoutJsonCodec::DecodeRequest(json::parse(R"({"concept": "Sleep", "clustering": 9, "items": []})"));
    assert(minimal && minimal->conceptText == "Sleep" && minimal->conceptEmbedding.empty() && "Concept as a string");
    assert(minimal->mode == LayoutMode::Walkabout && "Walkabout by default");
    assert(minimal->clusteringLevel == kMaxClusteringLevel && "Level is clamped");
    std::cout << "[PASS] Decode." << std::endl;
}

void TestRejects() {
    assert(!LayoutJsonCodec::DecodeRequest(json::array()) && "Root must be an object");
    assert(!LayoutJsonCodec::DecodeRequest(json::parse(R"({"mode": "gaggle"})")) && "Items are required");
    assert(!LayoutJsonCodec::DecodeRequest(json::parse(R"({"mode": "spiral", "items": []})")) && "Unknown mode");
    assert(!LayoutJsonCodec::DecodeRequest(json::parse(R"({"mode": 3, "items": []})")) && "Mode must be a string");
    assert(!LayoutJsonCodec::DecodeRequest(json::parse(R"({"items": [{"excerpt": "no id"}]})")) && "Item id required");
    assert(!LayoutJsonCodec::ReadRequestFile("test_root_codec_absent/request.json") && "Missing file");

    std::string testRoot = "test_root_codec";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);
    {
        std::ofstream out(testRoot + "/bad.json");
        out << "{\"items\": [";
    }
    assert(!LayoutJsonCodec::ReadRequestFile(testRoot + "/bad.json") && "Malformed JSON is reported");
    {
        std::ofstream out(testRoot + "/good.json");
        out << R"({"mode": "regiment", "items": [{"id": "x"}]})";
    }
    auto fromFile = LayoutJsonCodec::ReadRequestFile(testRoot + "/good.json");
    assert(fromFile && fromFile->mode == LayoutMode::Regiment && fromFile->items.size() == 1 && "File decodes");
    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Rejects." << std::endl;
}

void TestOutOfRangeNumbers() {
    auto huge = LayoutJsonCodec::DecodeRequest(json::parse(R"({
        "pathCap": 1e30,
        "clustering": 1e20,
        "items": [{"id": "x", "embedding": [1e300, 0.0], "similarity": 7.5}]
    })"));
    assert(huge && "Out-of-range numbers do not reject the request");
    assert(huge->pathCap == 0 && "Unrepresentable path cap is ignored");
    assert(huge->clusteringLevel == kMinClusteringLevel && "Unrepresentable level is ignored");
    assert(huge->items[0].embedding.empty() && "Embedding beyond float range is dropped");
    assert(huge->items[0].conceptSimilarity && *huge->items[0].conceptSimilarity == 1.0f && "Similarity is clamped");

    auto negative = LayoutJsonCodec::DecodeRequest(json::parse(R"({"clustering": -1e15, "pathCap": -2.5e9, "items": []})"));
    assert(negative && negative->clusteringLevel == kMinClusteringLevel && negative->pathCap == 0 &&
           "Large negative values are ignored");

    auto percent = LayoutJsonCodec::DecodeRequest(json::parse(R"({"clusteringPercent": 1e300, "items": []})"));
    assert(percent && percent->clusteringLevel == kMaxClusteringLevel && "Huge percent clamps to the top level");
    assert(ClusteringLevelFromPercent(-1e300) == kMinClusteringLevel && "Huge negative percent clamps to level 1");

    auto fractional = LayoutJsonCodec::DecodeRequest(json::parse(R"({"clustering": 2.7, "pathCap": 4.2, "items": []})"));
    assert(fractional && fractional->clusteringLevel == 2 && fractional->pathCap == 4 && "Fractions round down");
    std::cout << "[PASS] Out-of-range numbers." << std::endl;
}

void TestEncode() {
    LayoutResult result;
    result.mode = LayoutMode::Gaggle;
    result.items.push_back({"notes/a.md", {10.0, 20.0}, PlacementOutcome::Strict});
    result.items.push_back({"notes/b.md", {-5.5, 0.0}, PlacementOutcome::BestEffort});

    Card conceptCard;
    conceptCard.kind = CardKind::Concept;
    conceptCard.anchor = {0.0, -50.0};
    conceptCard.width = 400.0;
    conceptCard.height = 150.0;
    conceptCard.text = "Sleep";
    result.cards.push_back(conceptCard);

    Card pending;
    pending.kind = CardKind::ClusterSummary;
    pending.clusterId = 2;
    pending.pendingSummary = SummaryRequest{"Summarize.", {"One", "Two"}};
    result.cards.push_back(pending);

    json encoded = LayoutJsonCodec::EncodeResult(result);
    assert(encoded["mode"] == "gaggle" && "Mode name");
    assert(encoded["positions"].size() == 2 && "One entry per placed item");
    assert(encoded["positions"][0]["id"] == "notes/a.md" && encoded["positions"][0]["x"] == 10.0 && "Position");
    assert(encoded["positions"][1]["placement"] == "best-effort" && "Placement outcome");

    const json& first = encoded["cards"][0];
    assert(first["kind"] == "concept" && first["text"] == "Sleep" && first["width"] == 400.0 && "Concept card");
    assert(!first.contains("cluster") && !first.contains("pending") && "No cluster or request on plain cards");

    const json& second = encoded["cards"][1];
    assert(second["kind"] == "cluster-summary" && second["cluster"] == 2 && "Cluster id");
    assert(second["pending"]["prompt"] == "Summarize." && second["pending"]["sources"].size() == 2 &&
           "Pending request is exported");
    std::cout << "[PASS] Encode." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting LayoutJsonCodec Test..." << std::endl;
    TestDecode();
    TestRejects();
    TestOutOfRangeNumbers();
    TestEncode();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
