#include "infrastructure/PromptCatalog.hpp"
#include <cctype>

namespace regionwalker::infrastructure {

std::string PromptCatalog::GetSummarySystemPrompt() {
    return
        "You are a helpful assistant that creates 4-6 sentence summaries of the notes you are given, "
        "answering a question or addressing a concept when one is named. "
        "Always start directly with the summary content - never include introductory phrases, labels, "
        "or prefixes like \"Here is a summary\", \"Summary:\", or similar.";
}

std::string PromptCatalog::GetClusterSummaryPrompt() {
    return
        "Summarize the following notes in 4-6 sentences. Focus on the common themes and main ideas. "
        "Start directly with the summary content - do not include any introductory phrases like "
        "\"Here is a summary\" or \"Summary:\".";
}

std::string PromptCatalog::GetPathSummaryPrompt(const std::string& conceptText) {
    const std::string question = conceptText.empty() ? "the concept" : conceptText;
    return
        "Based on the following notes, provide a 4-6 sentence summary that answers: \"" + question + "\". "
        "Focus on the main themes and key insights from these notes. "
        "Start directly with the summary content - do not include any introductory phrases like "
        "\"Here is a summary\" or \"Summary:\".";
}

std::string PromptCatalog::MakeExcerpt(const std::string& text, size_t maxLength) {
    std::string excerpt;
    size_t paragraphEnd = text.find("\n\n");
    excerpt = text.substr(0, paragraphEnd);
    if (excerpt.empty()) {
        excerpt = text;
    }

    if (excerpt.size() > maxLength) {
        size_t cut = maxLength;
        // Back up over UTF-8 continuation bytes
        while (cut > 0 && (static_cast<unsigned char>(excerpt[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        excerpt.resize(cut);
    }

    for (char ch : excerpt) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            return excerpt;
        }
    }
    return "";
}

} // namespace regionwalker::infrastructure
