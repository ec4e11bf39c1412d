#include <cassert>
#include <iostream>
#include "application/ReviewHeuristics.hpp"

using draftlens::application::ReviewHeuristics;
using draftlens::domain::TextRange;

static void testStripIntensifiers() {
    assert(ReviewHeuristics::StripIntensifiers("这个故事非常精彩，很感人") == "这个故事精彩，感人");
    assert(ReviewHeuristics::StripIntensifiers("很好") == "好");
    assert(ReviewHeuristics::StripIntensifiers("  非常  重要 ") == "非常 重要" &&
           "An intensifier followed by whitespace stays.");
    assert(ReviewHeuristics::StripIntensifiers("结尾很") == "结尾很");
    assert(ReviewHeuristics::StripIntensifiers("abc很好") == "abc很好" &&
           "An intensifier glued to an ASCII word stays.");
    assert(ReviewHeuristics::StripIntensifiers("没有副词") == "没有副词");
    std::cout << "[PASS] strip intensifiers" << std::endl;
}

static void testLexicon() {
    assert(ReviewHeuristics::IntensifierLexicon().size() == 2);
    assert(ReviewHeuristics::ContainsIntensifier("这很好"));
    assert(!ReviewHeuristics::ContainsIntensifier("这不错"));
    auto present = ReviewHeuristics::IntensifiersPresent("非常好，很棒");
    assert(present.size() == 2);
    std::cout << "[PASS] lexicon" << std::endl;
}

static void testLocateText() {
    const std::string content = "第一行\n这里很好\n第三行";

    TextRange found = ReviewHeuristics::LocateText(content, "很好", 1);
    assert(found == (TextRange{1, 2, 1, 4}));

    // Leading whitespace in the search text widens the range to the left.
    TextRange padded = ReviewHeuristics::LocateText(content, "  很好", 1);
    assert(padded == (TextRange{1, 0, 1, 4}));

    // Found two lines above the hint.
    TextRange above = ReviewHeuristics::LocateText(content, "第一行", 2);
    assert(above == (TextRange{0, 0, 0, 3}));

    // Not found: whole hinted line.
    TextRange missing = ReviewHeuristics::LocateText(content, "不存在", 1);
    assert(missing == (TextRange{1, 0, 1, 4}));

    // Hint past the end clamps to the last line.
    TextRange clamped = ReviewHeuristics::LocateText(content, "不存在", 10);
    assert(clamped == (TextRange{2, 0, 2, 3}));

    // Outside the search window the hint wins.
    std::string longer = "目标\n1\n2\n3\n4\n5\n6";
    TextRange outside = ReviewHeuristics::LocateText(longer, "目标", 5);
    assert(outside.startLine == 5 && outside.startColumn == 0 && outside.endColumn == 1);

    std::cout << "[PASS] locate text" << std::endl;
}

int main() {
    std::cout << "[Test] Starting ReviewHeuristics Test..." << std::endl;
    testStripIntensifiers();
    testLexicon();
    testLocateText();
    std::cout << "[Test] ReviewHeuristics Test completed." << std::endl;
    return 0;
}
