/**
 * @file TextRange.hpp
 * @brief Zero-based line/column span inside a document.
 */

#pragma once

namespace draftlens::domain {

/**
 * @struct TextRange
 * @brief Half-open range [start, end) addressed by logical line and column.
 *
 * Columns count Unicode code points within a line, the same unit the
 * document capability uses for addressing.
 */
struct TextRange {
    int startLine = 0;
    int startColumn = 0;
    int endLine = 0;
    int endColumn = 0;

    /** @brief start <= end, and no negative coordinates. */
    bool isWellFormed() const {
        if (startLine < 0 || startColumn < 0 || endLine < 0 || endColumn < 0) return false;
        if (startLine < endLine) return true;
        return startLine == endLine && startColumn <= endColumn;
    }

    bool operator==(const TextRange& other) const {
        return startLine == other.startLine && startColumn == other.startColumn &&
               endLine == other.endLine && endColumn == other.endColumn;
    }

    bool operator!=(const TextRange& other) const { return !(*this == other); }
};

} // namespace draftlens::domain
