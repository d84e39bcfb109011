#include "infrastructure/OllamaEmbeddingSource.hpp"
#include <iostream>

namespace regionwalker::infrastructure {

namespace {
const char* kConceptKeyPrefix = "concept:";
}

OllamaEmbeddingSource::OllamaEmbeddingSource(std::shared_ptr<OllamaClient> client,
                                             const std::string& model,
                                             TextProvider textProvider,
                                             std::shared_ptr<EmbeddingCache> cache)
    : m_client(std::move(client)),
      m_model(model),
      m_textProvider(std::move(textProvider)),
      m_cache(std::move(cache)) {}

std::optional<std::vector<float>> OllamaEmbeddingSource::fetchEmbedding(const std::string& itemId) {
    if (!m_textProvider) return std::nullopt;

    auto text = m_textProvider(itemId);
    if (!text || text->empty()) {
        std::cerr << "[OllamaEmbeddingSource] No text available for " << itemId << std::endl;
        return std::nullopt;
    }
    return embedWithCache(itemId, *text);
}

std::optional<std::vector<float>> OllamaEmbeddingSource::embedText(const std::string& text) {
    if (text.empty()) return std::nullopt;
    return embedWithCache(kConceptKeyPrefix + EmbeddingCache::HashContent(text), text);
}

std::optional<std::vector<float>> OllamaEmbeddingSource::embedWithCache(const std::string& cacheKey, const std::string& text) {
    const std::string hash = EmbeddingCache::HashContent(text);
    if (m_cache) {
        if (auto cached = m_cache->get(cacheKey, hash)) {
            return cached;
        }
    }

    if (!m_client) return std::nullopt;
    auto embedding = m_client->getEmbedding(m_model, text);
    if (!embedding) {
        std::cerr << "[OllamaEmbeddingSource] Embedding failed for " << cacheKey << std::endl;
        return std::nullopt;
    }

    if (m_cache) {
        m_cache->update(cacheKey, hash, *embedding);
    }
    return embedding;
}

} // namespace regionwalker::infrastructure
