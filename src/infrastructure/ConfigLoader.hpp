/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access the Ollama endpoint and the layout
 * tunables without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "domain/LayoutConfig.hpp"

namespace regionwalker::infrastructure {

/**
 * @struct OllamaSettings
 * @brief Where to reach the model server and which models to use.
 */
struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string embeddingModel = "nomic-embed-text";
    std::string chatModel = "llama3.2";
};

/**
 * @struct Settings
 * @brief Everything settings.json can change.
 */
struct Settings {
    domain::LayoutConfig layout;
    OllamaSettings ollama;
    std::string embeddingCachePath; ///< Empty: default under the XDG cache home.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a file. Never throws.
     * @param path settings.json location; a missing file yields defaults.
     */
    static Settings Load(const std::filesystem::path& path);

    /** @brief Applies every recognised key of a parsed settings object over the defaults. */
    static Settings FromJson(const nlohmann::json& j);

    /** @brief $XDG_CONFIG_HOME/RegionWalker/settings.json. */
    static std::filesystem::path DefaultSettingsPath();
};

} // namespace regionwalker::infrastructure
