/**
 * @file Summarizer.hpp
 * @brief Interface for the text-summary collaborator used by summary cards.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace regionwalker::domain {

/**
 * @class Summarizer
 * @brief Turns a prompt plus source excerpts into short prose.
 */
class Summarizer {
public:
    virtual ~Summarizer() = default;

    /**
     * @brief Produces a summary.
     * @param prompt Instruction describing what the summary must answer.
     * @param sourceTexts Note excerpts the summary is based on.
     * @return Summary text, or std::nullopt on failure. No card is drawn then.
     */
    virtual std::optional<std::string> summarize(const std::string& prompt,
                                                 const std::vector<std::string>& sourceTexts) = 0;
};

} // namespace regionwalker::domain
