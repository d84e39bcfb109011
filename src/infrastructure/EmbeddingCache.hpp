/**
 * @file EmbeddingCache.hpp
 * @brief Persistence for note embeddings.
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>

namespace regionwalker::infrastructure {

/**
 * @class EmbeddingCache
 * @brief Local cache of embeddings so unchanged notes are not re-embedded.
 *
 * Entries are keyed by item id and only served while the stored content
 * hash still matches. Thread-safe.
 */
class EmbeddingCache {
public:
    /** @param cacheFile JSON file backing the cache; empty keeps it in memory only. */
    explicit EmbeddingCache(const std::string& cacheFile);

    /** @brief Updates or adds an embedding to the cache. */
    void update(const std::string& itemId, const std::string& contentHash, const std::vector<float>& embedding);

    /** @brief Retrieves an embedding if the hash matches. */
    std::optional<std::vector<float>> get(const std::string& itemId, const std::string& contentHash) const;

    size_t size() const;

    /** @brief Writes the cache file atomically. Returns false on failure. */
    bool persist() const;

    /** @brief Replaces the in-memory entries with the file's. A missing file is not an error. */
    bool load();

    /** @brief Hash used for the content key. */
    static std::string HashContent(const std::string& text);

private:
    std::string m_cacheFile;
    struct CacheEntry {
        std::string hash;
        std::vector<float> vector;
    };
    std::map<std::string, CacheEntry> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace regionwalker::infrastructure
