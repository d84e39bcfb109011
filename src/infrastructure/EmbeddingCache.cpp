/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <fstream>
#include <filesystem>
#include <functional>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace regionwalker::infrastructure {

EmbeddingCache::EmbeddingCache(const std::string& cacheFile) : m_cacheFile(cacheFile) {}

std::string EmbeddingCache::HashContent(const std::string& text) {
    return std::to_string(std::hash<std::string>{}(text));
}

void EmbeddingCache::update(const std::string& itemId, const std::string& contentHash, const std::vector<float>& embedding) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[itemId] = {contentHash, embedding};
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& itemId, const std::string& contentHash) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(itemId);
    if (it != m_entries.end() && it->second.hash == contentHash) {
        return it->second.vector;
    }
    return std::nullopt;
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool EmbeddingCache::persist() const {
    if (m_cacheFile.empty()) return true;

    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            j[id] = { {"hash", entry.hash}, {"vector", entry.vector} };
        }
    }

    if (!PersistenceService::writeAtomic(m_cacheFile, j.dump(4))) {
        std::cerr << "[EmbeddingCache] Failed to persist " << m_cacheFile << std::endl;
        return false;
    }
    return true;
}

bool EmbeddingCache::load() {
    if (m_cacheFile.empty()) return true;
    if (!fs::exists(m_cacheFile)) return true;

    std::map<std::string, CacheEntry> loaded;
    try {
        std::ifstream f(m_cacheFile);
        if (!f.is_open()) {
            std::cerr << "[EmbeddingCache] Cannot open " << m_cacheFile << std::endl;
            return false;
        }

        json j = json::parse(f);
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& value = it.value();
            if (value.contains("hash") && value.contains("vector")) {
                loaded[it.key()] = {value["hash"].get<std::string>(), value["vector"].get<std::vector<float>>()};
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[EmbeddingCache] Error reading " << m_cacheFile << ": " << e.what() << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries = std::move(loaded);
    return true;
}

} // namespace regionwalker::infrastructure
