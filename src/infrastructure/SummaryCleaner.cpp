#include "infrastructure/SummaryCleaner.hpp"
#include <regex>
#include <vector>
#include <cctype>

namespace regionwalker::infrastructure {

namespace {

const std::vector<std::regex>& PrefixPatterns() {
    static const std::vector<std::regex> patterns = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        std::vector<std::regex> list;
        for (const char* p : {
                 R"(^based on the following notes[,:]?\s*)",
                 R"(^here is a summary of the notes in \d+-\d+ sentences?[,:]?\s*)",
                 R"(^here is a summary[,:]?\s*)",
                 R"(^summary[,:]?\s*)",
                 R"(^the summary is[,:]?\s*)",
                 R"(^here is the summary[,:]?\s*)",
                 R"(^summary of the notes[,:]?\s*)",
                 R"(^this summary[,:]?\s*)",
                 R"(^the following summary[,:]?\s*)",
                 R"(^in summary[,:]?\s*)",
                 R"(^to summarize[,:]?\s*)",
                 R"(^summarizing[,:]?\s*)"}) {
            list.emplace_back(p, flags);
        }
        return list;
    }();
    return patterns;
}

// Em and en dashes are multi-byte in UTF-8, so they are alternatives rather than class members.
const std::regex kLeadingWrap("^(?:[\"'`\\-]|\xE2\x80\x94|\xE2\x80\x93)\\s*");
const std::regex kTrailingWrap("\\s*(?:[\"'`\\-]|\xE2\x80\x94|\xE2\x80\x93)$");
const std::regex kLeadingColon(R"(^[:;]\s*)");

} // namespace

std::string SummaryCleaner::Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string SummaryCleaner::Clean(const std::string& raw) {
    std::string summary = Trim(raw);
    if (summary.empty()) return summary;

    for (const auto& pattern : PrefixPatterns()) {
        summary = Trim(std::regex_replace(summary, pattern, "", std::regex_constants::format_first_only));
    }

    summary = std::regex_replace(summary, kLeadingWrap, "", std::regex_constants::format_first_only);
    summary = std::regex_replace(summary, kTrailingWrap, "", std::regex_constants::format_first_only);
    summary = std::regex_replace(summary, kLeadingColon, "", std::regex_constants::format_first_only);
    return Trim(summary);
}

} // namespace regionwalker::infrastructure
