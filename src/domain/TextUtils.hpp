/**
 * @file TextUtils.hpp
 * @brief UTF-8 helpers shared by the review heuristics and the document capability.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace draftlens::domain {

class TextUtils {
public:
    /** @brief Decodes the code point starting at byte @p pos. Invalid bytes decode as themselves with length 1. */
    static char32_t DecodeAt(const std::string& text, std::size_t pos, std::size_t& length);

    /** @brief Number of code points in @p text. */
    static std::size_t CodePointLength(const std::string& text);

    /** @brief Byte offset of the @p index-th code point, clamped to text.size(). */
    static std::size_t ByteOffsetOf(const std::string& text, std::size_t index);

    /** @brief Code point index of byte offset @p byteOffset. */
    static std::size_t CodePointIndexOf(const std::string& text, std::size_t byteOffset);

    /** @brief ASCII whitespace plus NBSP, U+2000..U+200A, U+2028/9, U+3000 and BOM. */
    static bool IsWhitespace(char32_t cp);

    /** @brief Splits on '\n'. Always returns at least one element. */
    static std::vector<std::string> SplitLines(const std::string& text);

    static std::string Trim(const std::string& text);
    static std::string TrimStart(const std::string& text);
    static bool IsBlank(const std::string& text);

    /** @brief Replaces every whitespace run with a single ASCII space. */
    static std::string CollapseWhitespace(const std::string& text);

    /** @brief Replaces backslashes with forward slashes. */
    static std::string NormalizeSeparators(const std::string& path);

    static bool EndsWith(const std::string& text, const std::string& suffix);
};

} // namespace draftlens::domain
