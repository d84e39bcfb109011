/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <type_traits>

namespace regionwalker::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void ReadNumber(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    const auto& value = j[key];
    if (!value.is_number()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a number" << std::endl;
        return;
    }
    const double number = value.get<double>();
    if (!std::isfinite(number) || number < static_cast<double>(std::numeric_limits<T>::lowest()) ||
        number > static_cast<double>(std::numeric_limits<T>::max())) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << value.dump() << " is out of range" << std::endl;
        return;
    }
    if constexpr (std::is_integral_v<T>) {
        target = static_cast<T>(std::floor(number));
    } else {
        target = static_cast<T>(number);
    }
}

void ReadString(const json& j, const char* key, std::string& target) {
    if (!j.contains(key)) return;
    const auto& value = j[key];
    if (!value.is_string()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a string" << std::endl;
        return;
    }
    target = value.get<std::string>();
}

void ApplyLayout(const json& j, domain::LayoutConfig& layout) {
    ReadNumber(j, "r_min", layout.radius.rMin);
    ReadNumber(j, "r_max", layout.radius.rMax);
    ReadNumber(j, "expansion_power", layout.radius.expansionPower);
    ReadNumber(j, "spring_constant", layout.force.springConstant);
    ReadNumber(j, "force_iterations", layout.force.iterations);
    ReadNumber(j, "damping", layout.force.damping);
    ReadNumber(j, "swirl_gap_ratio", layout.normalizer.swirlGapRatio);
    ReadNumber(j, "rotation_step_degrees", layout.normalizer.rotationStepDegrees);
    ReadNumber(j, "similarity_threshold", layout.path.similarityThreshold);
    ReadNumber(j, "max_path_length", layout.path.maxLength);
    ReadNumber(j, "gaggle_strict_attempts", layout.gaggle.strict.attempts);
    ReadNumber(j, "gaggle_relaxed_attempts", layout.gaggle.relaxed.attempts);
    ReadNumber(j, "note_width", layout.canvas.noteWidth);
    ReadNumber(j, "note_height", layout.canvas.noteHeight);

    const domain::LayoutConfig defaults;
    if (layout.radius.rMax <= layout.radius.rMin) {
        std::cerr << "[ConfigLoader] r_max must exceed r_min; keeping " << defaults.radius.rMin << ".."
                  << defaults.radius.rMax << std::endl;
        layout.radius.rMin = defaults.radius.rMin;
        layout.radius.rMax = defaults.radius.rMax;
    }
    if (layout.normalizer.rotationStepDegrees <= 0.0) {
        std::cerr << "[ConfigLoader] rotation_step_degrees must be positive" << std::endl;
        layout.normalizer.rotationStepDegrees = defaults.normalizer.rotationStepDegrees;
    }
    if (layout.canvas.noteWidth <= 0.0 || layout.canvas.noteHeight <= 0.0) {
        std::cerr << "[ConfigLoader] note_width and note_height must be positive" << std::endl;
        layout.canvas.noteWidth = defaults.canvas.noteWidth;
        layout.canvas.noteHeight = defaults.canvas.noteHeight;
    }
}

} // namespace

Settings ConfigLoader::FromJson(const json& j) {
    Settings settings;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object; using defaults" << std::endl;
        return settings;
    }

    ReadString(j, "ollama_host", settings.ollama.host);
    ReadNumber(j, "ollama_port", settings.ollama.port);
    ReadString(j, "ollama_embedding_model", settings.ollama.embeddingModel);
    ReadString(j, "ollama_chat_model", settings.ollama.chatModel);
    ReadString(j, "embedding_cache", settings.embeddingCachePath);

    if (j.contains("layout")) {
        if (j["layout"].is_object()) {
            ApplyLayout(j["layout"], settings.layout);
        } else {
            std::cerr << "[ConfigLoader] Ignoring 'layout': expected an object" << std::endl;
        }
    }
    return settings;
}

Settings ConfigLoader::Load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Settings{};
    }

    try {
        std::ifstream f(path);
        json j = json::parse(f);
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return Settings{};
}

fs::path ConfigLoader::DefaultSettingsPath() {
    return PathUtils::GetConfigDir() / "settings.json";
}

} // namespace regionwalker::infrastructure
