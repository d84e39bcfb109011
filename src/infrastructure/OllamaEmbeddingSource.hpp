/**
 * @file OllamaEmbeddingSource.hpp
 * @brief EmbeddingSource backed by the Ollama embeddings endpoint and a local cache.
 */

#pragma once
#include "domain/EmbeddingSource.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <functional>
#include <memory>
#include <string>

namespace regionwalker::infrastructure {

/**
 * @class OllamaEmbeddingSource
 * @brief Looks up an item's text, serves the cached vector when the text is
 * unchanged, and asks the model otherwise.
 */
class OllamaEmbeddingSource : public domain::EmbeddingSource {
public:
    /** @brief Returns the text to embed for an item id, or std::nullopt if unknown. */
    using TextProvider = std::function<std::optional<std::string>(const std::string& itemId)>;

    OllamaEmbeddingSource(std::shared_ptr<OllamaClient> client,
                          const std::string& model,
                          TextProvider textProvider,
                          std::shared_ptr<EmbeddingCache> cache = nullptr);

    /** @see domain::EmbeddingSource::fetchEmbedding */
    std::optional<std::vector<float>> fetchEmbedding(const std::string& itemId) override;

    /** @see domain::EmbeddingSource::embedText */
    std::optional<std::vector<float>> embedText(const std::string& text) override;

private:
    std::optional<std::vector<float>> embedWithCache(const std::string& cacheKey, const std::string& text);

    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
    TextProvider m_textProvider;
    std::shared_ptr<EmbeddingCache> m_cache;
};

} // namespace regionwalker::infrastructure
