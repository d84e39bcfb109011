/**
 * @file OllamaSummarizer.hpp
 * @brief Summarizer backed by the Ollama chat endpoint.
 */

#pragma once
#include "domain/Summarizer.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <memory>
#include <string>

namespace regionwalker::infrastructure {

/**
 * @class OllamaSummarizer
 * @brief Implements Summarizer with one /api/chat round trip per card.
 */
class OllamaSummarizer : public domain::Summarizer {
public:
    /**
     * @param client Shared HTTP client.
     * @param model Chat model name (e.g. "llama3.2").
     * @param options Sampling options; defaults keep summaries short and focused.
     */
    OllamaSummarizer(std::shared_ptr<OllamaClient> client,
                     const std::string& model,
                     const ChatOptions& options = ChatOptions{});

    /** @see domain::Summarizer::summarize */
    std::optional<std::string> summarize(const std::string& prompt,
                                         const std::vector<std::string>& sourceTexts) override;

    /** @brief User message: instruction, excerpts separated by blank lines, then "Summary:". */
    static std::string BuildUserMessage(const std::string& prompt, const std::vector<std::string>& sourceTexts);

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
    ChatOptions m_options;
};

} // namespace regionwalker::infrastructure
