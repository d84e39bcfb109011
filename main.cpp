#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "application/LayoutService.hpp"
#include "domain/RandomSource.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/LayoutJsonCodec.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaEmbeddingSource.hpp"
#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace regionwalker;

namespace {

struct CliOptions {
    fs::path requestPath;
    fs::path outputPath;
    fs::path settingsPath;
    std::optional<std::uint64_t> seed;
    bool summaries = true;
};

void PrintUsage() {
    std::cout << "Usage: regionwalker <request.json> [-o result.json] [--settings file] [--seed N] [--no-summaries]\n"
              << "  -o, --output     Result file (default: <request>.layout.json next to the request)\n"
              << "  --settings       settings.json to use (default: $XDG_CONFIG_HOME/RegionWalker/settings.json)\n"
              << "  --seed           Fixed random seed for reproducible layouts\n"
              << "  --no-summaries   Do not contact the chat model; summary cards stay pending\n";
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "[Main] Missing value for " << name << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg == "-o" || arg == "--output") {
            auto value = needValue("--output");
            if (!value) return std::nullopt;
            options.outputPath = *value;
        } else if (arg == "--settings") {
            auto value = needValue("--settings");
            if (!value) return std::nullopt;
            options.settingsPath = *value;
        } else if (arg == "--seed") {
            auto value = needValue("--seed");
            if (!value) return std::nullopt;
            try {
                options.seed = std::stoull(*value);
            } catch (const std::exception&) {
                std::cerr << "[Main] Invalid seed: " << *value << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--no-summaries") {
            options.summaries = false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[Main] Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else if (options.requestPath.empty()) {
            options.requestPath = arg;
        } else {
            std::cerr << "[Main] Unexpected argument: " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (options.requestPath.empty()) {
        std::cerr << "[Main] No request file given" << std::endl;
        return std::nullopt;
    }
    if (options.outputPath.empty()) {
        options.outputPath = options.requestPath;
        options.outputPath.replace_extension(".layout.json");
    }
    if (options.settingsPath.empty()) {
        options.settingsPath = infrastructure::ConfigLoader::DefaultSettingsPath();
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return EXIT_FAILURE;
    }

    infrastructure::Settings settings = infrastructure::ConfigLoader::Load(options->settingsPath);

    auto request = infrastructure::LayoutJsonCodec::ReadRequestFile(options->requestPath);
    if (!request) {
        return EXIT_FAILURE;
    }
    request->generateSummaries = options->summaries;

    // Notes without a precomputed vector are embedded from their excerpt
    std::map<std::string, std::string> excerpts;
    for (const auto& item : request->items) {
        excerpts[item.id] = item.excerpt;
    }
    auto textProvider = [&excerpts](const std::string& itemId) -> std::optional<std::string> {
        auto it = excerpts.find(itemId);
        if (it == excerpts.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };

    const std::string cacheFile = settings.embeddingCachePath.empty()
        ? infrastructure::PathUtils::GetEmbeddingCacheFile().string()
        : settings.embeddingCachePath;
    auto cache = std::make_shared<infrastructure::EmbeddingCache>(cacheFile);
    cache->load();

    auto client = std::make_shared<infrastructure::OllamaClient>(settings.ollama.host, settings.ollama.port);
    auto embeddings = std::make_shared<infrastructure::OllamaEmbeddingSource>(
        client, settings.ollama.embeddingModel, textProvider, cache);
    std::shared_ptr<domain::Summarizer> summarizer;
    if (options->summaries) {
        summarizer = std::make_shared<infrastructure::OllamaSummarizer>(client, settings.ollama.chatModel);
    }

    application::LayoutService service(settings.layout, embeddings, summarizer);

    std::unique_ptr<domain::RandomSource> rng;
    if (options->seed) {
        rng = std::make_unique<domain::MersenneRandomSource>(*options->seed);
    } else {
        rng = std::make_unique<domain::MersenneRandomSource>();
    }

    auto result = service.Arrange(*request, *rng);
    if (!result) {
        return EXIT_FAILURE;
    }

    cache->persist();

    infrastructure::PersistenceService persistence;
    persistence.saveTextAsync(options->outputPath.string(),
                              infrastructure::LayoutJsonCodec::EncodeResult(*result).dump(2));
    persistence.flush();
    persistence.stop();
    if (persistence.failedWrites() > 0) {
        std::cerr << "[Main] Could not write " << options->outputPath << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "[Main] Wrote " << result->items.size() << " positions and " << result->cards.size()
              << " cards (" << domain::LayoutModeToString(result->mode) << ") to " << options->outputPath
              << std::endl;
    return EXIT_SUCCESS;
}
