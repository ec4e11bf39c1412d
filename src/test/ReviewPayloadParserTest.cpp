#include <cassert>
#include <iostream>
#include "domain/BackendError.hpp"
#include "infrastructure/ReviewPayloadParser.hpp"

using namespace draftlens;
using infrastructure::ReviewPayloadParser;

static bool ThrowsParseError(const std::string& content) {
    try {
        ReviewPayloadParser::ParseTextReview(content);
    } catch (const domain::BackendError& e) {
        return e.code() == domain::BackendErrorCode::ParseError;
    }
    return false;
}

int main() {
    std::cout << "[Test] Starting ReviewPayloadParser Test..." << std::endl;

    assert(ReviewPayloadParser::StripCodeFences("```json\n{\"a\":1}\n```") == "{\"a\":1}");
    assert(ReviewPayloadParser::StripCodeFences("```\n{}\n```  ") == "{}");
    assert(ReviewPayloadParser::StripCodeFences("  {\"a\":1} ") == "{\"a\":1}");
    std::cout << "[PASS] strip code fences" << std::endl;

    auto defaults = ReviewPayloadParser::ParseTextReview("{}");
    assert(defaults.overall && *defaults.overall == "整体质量良好");
    assert(defaults.strengths && defaults.strengths->empty());
    assert(defaults.improvements && defaults.improvements->empty());
    assert(defaults.rating && *defaults.rating == 7);
    assert(defaults.suggestions.empty());

    auto zero = ReviewPayloadParser::ParseTextReview(R"({"rating": 0})");
    assert(zero.rating && *zero.rating == 0 && "A zero rating is kept.");

    auto textRating = ReviewPayloadParser::ParseTextReview(R"({"rating": "nine"})");
    assert(textRating.rating && *textRating.rating == 7);
    std::cout << "[PASS] text review defaults" << std::endl;

    auto parsed = ReviewPayloadParser::ParseTextReview(
        R"({"suggestions":[{"kind":"content","startLine":2,"startColumn":1,"endColumn":3,"reason":"r"}, "junk"]})");
    assert(parsed.suggestions.size() == 1);
    assert(parsed.suggestions[0].kind == "content");
    assert(parsed.suggestions[0].startLine && *parsed.suggestions[0].startLine == 2);
    assert(!parsed.suggestions[0].line);
    assert(!parsed.suggestions[0].original);
    std::cout << "[PASS] suggestion fields" << std::endl;

    auto oddCoordinates = ReviewPayloadParser::ParseTextReview(
        R"({"suggestions":[{"startLine":1e12,"startColumn":2.5,"endColumn":-3e10,"line":4,"reason":"r"}]})");
    assert(oddCoordinates.suggestions.size() == 1);
    assert(!oddCoordinates.suggestions[0].startLine && "Values beyond int range are dropped.");
    assert(!oddCoordinates.suggestions[0].startColumn && "Fractional positions are dropped.");
    assert(!oddCoordinates.suggestions[0].endColumn);
    assert(oddCoordinates.suggestions[0].line && *oddCoordinates.suggestions[0].line == 4);

    auto hugeCounts = ReviewPayloadParser::ParseDiffAnalysis(
        R"({"consistencyReport": {"score": 1e15}, "semanticChanges": [{"type": "addition", "lineNumber": 9e18}]})", "");
    assert(hugeCounts.consistencyReport.score == 80);
    assert(hugeCounts.semanticChanges.size() == 1);
    assert(hugeCounts.semanticChanges[0].lineNumber == 0);
    std::cout << "[PASS] out of range numbers" << std::endl;

    assert(ThrowsParseError("not json"));
    assert(ThrowsParseError("[1, 2]"));
    std::cout << "[PASS] parse errors" << std::endl;

    auto counts = ReviewPayloadParser::CountDiffLines("--- a\n+++ b\n@@ -1,2 +1,2 @@\n-x\n-y\n+z\n context\n");
    assert(counts.additions == 1);
    assert(counts.deletions == 2);

    auto analysis = ReviewPayloadParser::ParseDiffAnalysis(R"({"additions": 99})", "+a\n+b\n-c");
    assert(analysis.additions == 2 && "Counts come from the diff, not the backend.");
    assert(analysis.deletions == 1);
    assert(analysis.modifications == 1);
    assert(analysis.summary == "无明显变化");
    assert(analysis.consistencyReport.score == 80);
    std::cout << "[PASS] diff analysis" << std::endl;

    std::cout << "[Test] ReviewPayloadParser Test completed." << std::endl;
    return 0;
}
