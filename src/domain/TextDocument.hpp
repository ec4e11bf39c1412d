/**
 * @file TextDocument.hpp
 * @brief Capabilities of the live document and of the editor that hosts it.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/TextRange.hpp"

namespace draftlens::domain {

/**
 * @class TextDocument
 * @brief An open, addressable document.
 */
class TextDocument {
public:
    virtual ~TextDocument() = default;

    /**
     * @brief Returns the text inside a range.
     * @throws std::out_of_range when the range cannot be resolved.
     */
    virtual std::string getText(const TextRange& range) const = 0;

    /**
     * @brief Replaces a range as one edit.
     * @return false when the edit was rejected. May throw on hard failures.
     */
    virtual bool replace(const TextRange& range, const std::string& text) = 0;

    virtual int lineCount() const = 0;
    virtual std::string path() const = 0;
    virtual int version() const = 0;
};

/**
 * @class EditorHost
 * @brief Gives access to the currently active document.
 */
class EditorHost {
public:
    virtual ~EditorHost() = default;

    /** @brief The active document, or nullptr when nothing is open. */
    virtual std::shared_ptr<TextDocument> activeDocument() = 0;

    /** @brief False when the file is missing or cannot be written. */
    virtual bool isWritable(const std::string& path) const = 0;
};

} // namespace draftlens::domain
