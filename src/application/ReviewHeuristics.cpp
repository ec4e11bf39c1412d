/**
 * @file ReviewHeuristics.cpp
 * @brief Implementation of ReviewHeuristics.
 */

#include "application/ReviewHeuristics.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>

namespace draftlens::application {

using domain::TextUtils;

namespace {

constexpr int kSearchBefore = 2;
constexpr int kSearchAfter = 3;

bool IsAsciiAlnum(char32_t cp) {
    return (cp >= U'0' && cp <= U'9') || (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

} // namespace

const std::vector<std::string>& ReviewHeuristics::IntensifierLexicon() {
    static const std::vector<std::string> lexicon = {"非常", "很"};
    return lexicon;
}

bool ReviewHeuristics::ContainsIntensifier(const std::string& text) {
    for (const auto& word : IntensifierLexicon()) {
        if (text.find(word) != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> ReviewHeuristics::IntensifiersPresent(const std::string& text) {
    std::vector<std::string> present;
    for (const auto& word : IntensifierLexicon()) {
        if (text.find(word) != std::string::npos) present.push_back(word);
    }
    return present;
}

std::string ReviewHeuristics::StripIntensifiers(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    char32_t previous = U' ';
    bool atStart = true;
    size_t pos = 0;

    while (pos < text.size()) {
        bool removed = false;
        if (atStart || !IsAsciiAlnum(previous)) {
            for (const auto& word : IntensifierLexicon()) {
                if (text.compare(pos, word.size(), word) != 0) continue;
                size_t next = pos + word.size();
                if (next >= text.size()) break;
                size_t len = 1;
                char32_t following = TextUtils::DecodeAt(text, next, len);
                if (TextUtils::IsWhitespace(following)) break;
                pos = next;
                removed = true;
                break;
            }
        }
        if (removed) continue;

        size_t len = 1;
        previous = TextUtils::DecodeAt(text, pos, len);
        out.append(text, pos, len);
        pos += len;
        atStart = false;
    }

    return TextUtils::Trim(TextUtils::CollapseWhitespace(out));
}

domain::TextRange ReviewHeuristics::LocateText(const std::string& content, const std::string& searchText, int approxLine) {
    auto lines = TextUtils::SplitLines(content);
    const int lineCount = static_cast<int>(lines.size());
    const std::string needle = TextUtils::Trim(searchText);
    const int needleLength = static_cast<int>(TextUtils::CodePointLength(searchText));

    if (!needle.empty()) {
        int first = std::max(0, approxLine - kSearchBefore);
        int last = std::min(lineCount, approxLine + kSearchAfter);
        for (int i = first; i < last; ++i) {
            size_t found = lines[i].find(needle);
            if (found == std::string::npos) continue;

            int column = static_cast<int>(TextUtils::CodePointIndexOf(lines[i], found));
            int leading = static_cast<int>(TextUtils::CodePointLength(searchText) -
                                           TextUtils::CodePointLength(TextUtils::TrimStart(searchText)));
            int start = std::max(0, column - leading);
            return {i, start, i, start + needleLength};
        }
    }

    int line = std::clamp(approxLine, 0, std::max(0, lineCount - 1));
    int length = lineCount > 0 ? static_cast<int>(TextUtils::CodePointLength(lines[line])) : 0;
    return {line, 0, line, length};
}

} // namespace draftlens::application
