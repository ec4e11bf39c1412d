/**
 * @file ReviewHeuristics.hpp
 * @brief Text heuristics used by the offline review path.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/TextRange.hpp"

namespace draftlens::application {

/**
 * @class ReviewHeuristics
 * @brief Stateless helpers for intensifier detection and approximate text location.
 */
class ReviewHeuristics {
public:
    /** @brief Degree adverbs flagged by the offline review, longest first. */
    static const std::vector<std::string>& IntensifierLexicon();

    static bool ContainsIntensifier(const std::string& text);

    /** @brief Lexicon entries occurring in @p text, in lexicon order. */
    static std::vector<std::string> IntensifiersPresent(const std::string& text);

    /**
     * @brief Removes standalone intensifiers, then collapses whitespace and trims.
     *
     * An occurrence is standalone when a non-whitespace character follows it and it
     * is not glued to a preceding ASCII letter or digit.
     */
    static std::string StripIntensifiers(const std::string& text);

    /**
     * @brief Finds @p searchText near @p approxLine in @p content.
     *
     * Searches lines [approxLine - 2, approxLine + 3) for the trimmed text. When it is not
     * found, returns the whole of the approximate line clamped to the document.
     */
    static domain::TextRange LocateText(const std::string& content, const std::string& searchText, int approxLine);
};

} // namespace draftlens::application
