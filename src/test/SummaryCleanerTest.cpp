#include <cassert>
#include <iostream>
#include <memory>

#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/SummaryCleaner.hpp"

using namespace regionwalker::infrastructure;

int main() {
    std::cout << "[Test] Starting SummaryCleaner Test..." << std::endl;

    // Boilerplate prefixes
    assert(SummaryCleaner::Clean("Here is a summary: The notes argue for X.") == "The notes argue for X." &&
           "Plain prefix removed");
    assert(SummaryCleaner::Clean("Here is a summary of the notes in 4-6 sentences: Bar.") == "Bar." &&
           "Sentence-count prefix removed");
    assert(SummaryCleaner::Clean("Based on the following notes, here is a summary: Foo.") == "Foo." &&
           "Stacked prefixes removed in turn");
    assert(SummaryCleaner::Clean("IN SUMMARY, the notes agree.") == "the notes agree." && "Case-insensitive");
    assert(SummaryCleaner::Clean("Summary:") == "" && "Nothing but a label leaves nothing");
    std::cout << "[PASS] Prefix stripping." << std::endl;

    // Wrapping punctuation
    assert(SummaryCleaner::Clean("Summary: \"Quoted text.\"") == "Quoted text." && "Wrapping quotes removed");
    assert(SummaryCleaner::Clean("\xE2\x80\x94 Dash led.") == "Dash led." && "Leading em dash removed");
    assert(SummaryCleaner::Clean(": leading colon") == "leading colon" && "Leading colon removed");
    assert(SummaryCleaner::Clean("  \n\t ") == "" && "Whitespace only");
    assert(SummaryCleaner::Clean("Notes converge on a summary: x") == "Notes converge on a summary: x" &&
           "Text in the middle is untouched");
    assert(SummaryCleaner::Trim("\t padded \n") == "padded" && "Trim both ends");
    std::cout << "[PASS] Wrapping punctuation." << std::endl;

    // Excerpts
    assert(PromptCatalog::MakeExcerpt("First para.\n\nSecond.", 500) == "First para." && "First paragraph only");
    assert(PromptCatalog::MakeExcerpt("\n\nOnly later text", 500) == "\n\nOnly later text" &&
           "Empty first paragraph falls back to the whole text");
    assert(PromptCatalog::MakeExcerpt("abcdefghij", 4) == "abcd" && "Capped at the byte limit");
    assert(PromptCatalog::MakeExcerpt("\xC3\xA9\xC3\xA9\xC3\xA9", 3) == "\xC3\xA9" &&
           "Never splits a multi-byte character");
    assert(PromptCatalog::MakeExcerpt(" \n \t", 500).empty() && "Whitespace-only text has no excerpt");
    std::cout << "[PASS] Excerpts." << std::endl;

    // Prompts
    assert(PromptCatalog::GetPathSummaryPrompt("Why sleep?").find("\"Why sleep?\"") != std::string::npos &&
           "Path prompt quotes the concept");
    assert(PromptCatalog::GetPathSummaryPrompt("").find("the concept") != std::string::npos &&
           "Missing concept gets a generic phrase");
    assert(OllamaSummarizer::BuildUserMessage("Do it.", {"One", "Two"}) == "Do it.\n\nNotes:\nOne\n\nTwo\n\nSummary:" &&
           "User message layout");
    std::cout << "[PASS] Prompts." << std::endl;

    // Nobody listens on port 1
    auto client = std::make_shared<OllamaClient>("127.0.0.1", 1);
    OllamaSummarizer summarizer(client, "llama3.2");
    assert(!summarizer.summarize("Do it.", {"One"}) && "Unreachable server yields no summary");
    assert(!summarizer.summarize("Do it.", {}) && "No sources, no request");
    std::cout << "[PASS] Unreachable summarizer." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
