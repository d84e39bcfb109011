/**
 * @file SummaryCleaner.hpp
 * @brief Strips boilerplate the chat model tends to put around a summary.
 */

#pragma once

#include <string>

namespace regionwalker::infrastructure {

class SummaryCleaner {
public:
    /**
     * @brief Removes "Here is a summary:"-style prefixes, wrapping quotes or
     * dashes, and a leading colon, then trims whitespace.
     * @return The cleaned text; empty when nothing useful is left.
     */
    static std::string Clean(const std::string& raw);

    /** @brief Trims ASCII whitespace at both ends. */
    static std::string Trim(const std::string& text);
};

} // namespace regionwalker::infrastructure
