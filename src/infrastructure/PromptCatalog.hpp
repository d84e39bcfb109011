/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the summary prompts sent to the chat model.
 */

#pragma once

#include <string>
#include <cstddef>

namespace regionwalker::infrastructure {

class PromptCatalog {
public:
    /** @brief System message shared by every summary request. */
    static std::string GetSummarySystemPrompt();

    /** @brief Instruction for a cluster summary card. */
    static std::string GetClusterSummaryPrompt();

    /** @brief Instruction for the card at the end of a path, framed as answering the concept. */
    static std::string GetPathSummaryPrompt(const std::string& conceptText);

    /**
     * @brief Summarizer source text for one note.
     *
     * First paragraph (up to the first blank line) capped at maxLength bytes,
     * never splitting a UTF-8 sequence. Whitespace-only text yields "".
     */
    static std::string MakeExcerpt(const std::string& text, size_t maxLength);
};

} // namespace regionwalker::infrastructure
