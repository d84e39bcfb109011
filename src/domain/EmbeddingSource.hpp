/**
 * @file EmbeddingSource.hpp
 * @brief Interface for looking up an item's embedding vector.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace regionwalker::domain {

/**
 * @class EmbeddingSource
 * @brief Supplies embeddings for items the caller did not embed up front.
 *
 * Implementations may hit a cache or a model server. Failures are reported
 * as std::nullopt; the layout then skips the item.
 */
class EmbeddingSource {
public:
    virtual ~EmbeddingSource() = default;

    /**
     * @brief Fetches the embedding of an item.
     * @param itemId Identifier of the note.
     * @return The vector, or std::nullopt when unavailable.
     */
    virtual std::optional<std::vector<float>> fetchEmbedding(const std::string& itemId) = 0;

    /**
     * @brief Embeds free text (e.g. the concept phrase).
     * @return The vector, or std::nullopt when unsupported or failed.
     */
    virtual std::optional<std::vector<float>> embedText(const std::string& text) {
        (void)text;
        return std::nullopt;
    }
};

} // namespace regionwalker::domain
