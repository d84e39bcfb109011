/**
 * @file PathUtils.hpp
 * @brief Per-user locations for RegionWalker's settings and caches.
 */
#pragma once
#include <filesystem>

namespace regionwalker::infrastructure {

class PathUtils {
public:
    /// $XDG_CONFIG_HOME/RegionWalker, else ~/.config/RegionWalker.
    static std::filesystem::path GetConfigDir();
    /// $XDG_CACHE_HOME/RegionWalker, else ~/.cache/RegionWalker.
    static std::filesystem::path GetCacheDir();

    /** @brief Cache file for note embeddings; its directory is created if missing. */
    static std::filesystem::path GetEmbeddingCacheFile();

private:
    static std::filesystem::path ResolveXdgDir(const char* variable, const char* homeFallback);
};

} // namespace regionwalker::infrastructure
