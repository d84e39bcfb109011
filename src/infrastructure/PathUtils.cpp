#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <iostream>
#include <system_error>

namespace regionwalker::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "RegionWalker";
}

fs::path PathUtils::ResolveXdgDir(const char* variable, const char* homeFallback) {
    if (const char* xdg = std::getenv(variable); xdg && *xdg) {
        return fs::path(xdg) / kAppDirName;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeFallback / kAppDirName;
    }
    // No home directory (service accounts, containers): stay next to the caller.
    return fs::current_path() / kAppDirName;
}

fs::path PathUtils::GetConfigDir() {
    return ResolveXdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheDir() {
    return ResolveXdgDir("XDG_CACHE_HOME", ".cache");
}

fs::path PathUtils::GetEmbeddingCacheFile() {
    const fs::path dir = GetCacheDir();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << dir << ": " << ec.message() << std::endl;
    }
    return dir / "embeddings.json";
}

} // namespace regionwalker::infrastructure
