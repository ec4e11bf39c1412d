/**
 * @file FileTextDocument.hpp
 * @brief Document capability backed by a file on disk.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/TextDocument.hpp"

namespace draftlens::infrastructure {

/**
 * @class FileTextDocument
 * @brief Holds a file's lines in memory; edits are kept until save().
 *
 * Lines are split on '\n' only, so a trailing '\r' is part of the line content.
 * Columns count Unicode code points. Columns past the end of a line are clamped
 * to the line length.
 */
class FileTextDocument : public domain::TextDocument {
public:
    FileTextDocument(std::string path, const std::string& content);

    /**
     * @brief Loads a file.
     * @throws std::runtime_error when the file cannot be read.
     */
    static std::shared_ptr<FileTextDocument> Open(const std::string& path);

    std::string getText(const domain::TextRange& range) const override;
    bool replace(const domain::TextRange& range, const std::string& text) override;
    int lineCount() const override { return static_cast<int>(m_lines.size()); }
    std::string path() const override { return m_path; }
    int version() const override { return m_version; }

    /** @brief Full content joined with '\n'. */
    std::string content() const;

    bool isDirty() const { return m_dirty; }

    /**
     * @brief Writes the content to path() via temp file + rename.
     * @return false when any step failed; the original file is then left untouched.
     */
    bool save();

private:
    struct Span {
        int startLine;
        size_t startByte;
        int endLine;
        size_t endByte;
    };

    /** @throws std::out_of_range */
    Span resolve(const domain::TextRange& range) const;

    std::string m_path;
    std::vector<std::string> m_lines;
    int m_version = 1;
    bool m_dirty = false;
};

/**
 * @class FileEditorHost
 * @brief Tracks a single active FileTextDocument.
 */
class FileEditorHost : public domain::EditorHost {
public:
    FileEditorHost() = default;
    explicit FileEditorHost(std::shared_ptr<domain::TextDocument> active);

    /**
     * @brief Opens @p path and makes it the active document.
     * @throws std::runtime_error when the file cannot be read.
     */
    std::shared_ptr<FileTextDocument> open(const std::string& path);

    void setActive(std::shared_ptr<domain::TextDocument> document);
    void closeActive();

    std::shared_ptr<domain::TextDocument> activeDocument() override { return m_active; }
    bool isWritable(const std::string& path) const override;

private:
    std::shared_ptr<domain::TextDocument> m_active;
};

} // namespace draftlens::infrastructure
