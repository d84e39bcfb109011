#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/SummaryCleaner.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace regionwalker::infrastructure {

using json = nlohmann::json;

OllamaSummarizer::OllamaSummarizer(std::shared_ptr<OllamaClient> client,
                                   const std::string& model,
                                   const ChatOptions& options)
    : m_client(std::move(client)), m_model(model), m_options(options) {}

std::string OllamaSummarizer::BuildUserMessage(const std::string& prompt, const std::vector<std::string>& sourceTexts) {
    std::string message = prompt + "\n\nNotes:\n";
    for (size_t i = 0; i < sourceTexts.size(); ++i) {
        if (i > 0) message += "\n\n";
        message += sourceTexts[i];
    }
    message += "\n\nSummary:";
    return message;
}

std::optional<std::string> OllamaSummarizer::summarize(const std::string& prompt,
                                                       const std::vector<std::string>& sourceTexts) {
    if (!m_client || sourceTexts.empty()) return std::nullopt;

    json messages = json::array({
        {{"role", "system"}, {"content", PromptCatalog::GetSummarySystemPrompt()}},
        {{"role", "user"}, {"content", BuildUserMessage(prompt, sourceTexts)}}
    });

    auto reply = m_client->chat(m_model, messages, m_options);
    if (!reply) {
        std::cerr << "[OllamaSummarizer] No reply from model " << m_model << std::endl;
        return std::nullopt;
    }

    std::string summary = SummaryCleaner::Clean(*reply);
    if (summary.empty()) {
        std::cerr << "[OllamaSummarizer] Model returned an empty summary" << std::endl;
        return std::nullopt;
    }
    return summary;
}

} // namespace regionwalker::infrastructure
