/**
 * @file ReviewPayloadParser.hpp
 * @brief Turns backend completion text into RawCritique / DiffAnalysis.
 */

#pragma once

#include <string>
#include "domain/BackendAdapter.hpp"

namespace draftlens::infrastructure {

struct DiffLineCounts {
    int additions = 0;
    int deletions = 0;
};

class ReviewPayloadParser {
public:
    /** @brief Removes a surrounding ```json ... ``` (or bare ```) fence. */
    static std::string StripCodeFences(const std::string& content);

    /**
     * @brief Parses a text review payload.
     *
     * Missing overall becomes "整体质量良好", missing arrays become empty and a
     * missing or non-numeric rating becomes 7.
     * @throws domain::BackendError{ParseError} when the payload is not a JSON object.
     */
    static domain::RawCritique ParseTextReview(const std::string& content);

    /**
     * @brief Parses a diff analysis payload. Line counts come from @p diffText, not the backend.
     * @throws domain::BackendError{ParseError}
     */
    static domain::DiffAnalysis ParseDiffAnalysis(const std::string& content, const std::string& diffText);

    /** @brief Counts '+' and '-' lines, skipping file headers and hunk markers. */
    static DiffLineCounts CountDiffLines(const std::string& diffText);
};

} // namespace draftlens::infrastructure
