/**
 * @file TextUtils.cpp
 * @brief Implementation of TextUtils.
 */

#include "domain/TextUtils.hpp"
#include <algorithm>

namespace draftlens::domain {

char32_t TextUtils::DecodeAt(const std::string& text, std::size_t pos, std::size_t& length) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t expected = 1;
    char32_t cp = lead;
    if (lead >= 0xF0 && lead <= 0xF4) {
        expected = 4;
        cp = lead & 0x07;
    } else if (lead >= 0xE0) {
        expected = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        expected = 2;
        cp = lead & 0x1F;
    }

    if (expected == 1 || pos + expected > text.size()) {
        length = 1;
        return lead;
    }
    for (std::size_t i = 1; i < expected; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            length = 1;
            return lead;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    length = expected;
    return cp;
}

std::size_t TextUtils::CodePointLength(const std::string& text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t len = 1;
        DecodeAt(text, pos, len);
        pos += len;
        ++count;
    }
    return count;
}

std::size_t TextUtils::ByteOffsetOf(const std::string& text, std::size_t index) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < index && pos < text.size(); ++i) {
        std::size_t len = 1;
        DecodeAt(text, pos, len);
        pos += len;
    }
    return pos;
}

std::size_t TextUtils::CodePointIndexOf(const std::string& text, std::size_t byteOffset) {
    std::size_t count = 0;
    std::size_t pos = 0;
    const std::size_t limit = std::min(byteOffset, text.size());
    while (pos < limit) {
        std::size_t len = 1;
        DecodeAt(text, pos, len);
        pos += len;
        ++count;
    }
    return count;
}

bool TextUtils::IsWhitespace(char32_t cp) {
    switch (cp) {
        case U' ': case U'\t': case U'\n': case U'\r': case U'\v': case U'\f':
        case 0x00A0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::vector<std::string> TextUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string TextUtils::TrimStart(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t len = 1;
        char32_t cp = DecodeAt(text, pos, len);
        if (!IsWhitespace(cp)) break;
        pos += len;
    }
    return text.substr(pos);
}

std::string TextUtils::Trim(const std::string& text) {
    std::string head = TrimStart(text);
    // Walk forward remembering the end of the last non-whitespace code point.
    std::size_t lastEnd = 0;
    std::size_t pos = 0;
    while (pos < head.size()) {
        std::size_t len = 1;
        char32_t cp = DecodeAt(head, pos, len);
        pos += len;
        if (!IsWhitespace(cp)) lastEnd = pos;
    }
    return head.substr(0, lastEnd);
}

bool TextUtils::IsBlank(const std::string& text) {
    return Trim(text).empty();
}

std::string TextUtils::CollapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool inRun = false;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t len = 1;
        char32_t cp = DecodeAt(text, pos, len);
        if (IsWhitespace(cp)) {
            if (!inRun) out.push_back(' ');
            inRun = true;
        } else {
            out.append(text, pos, len);
            inRun = false;
        }
        pos += len;
    }
    return out;
}

std::string TextUtils::NormalizeSeparators(const std::string& path) {
    std::string out = path;
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

bool TextUtils::EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace draftlens::domain
