/**
 * @file FileTextDocument.cpp
 * @brief Implementation of FileTextDocument and FileEditorHost.
 */

#include "infrastructure/FileTextDocument.hpp"
#include "domain/TextUtils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace draftlens::infrastructure {

using domain::TextUtils;

FileTextDocument::FileTextDocument(std::string path, const std::string& content)
    : m_path(std::move(path)), m_lines(TextUtils::SplitLines(content)) {}

std::shared_ptr<FileTextDocument> FileTextDocument::Open(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return std::make_shared<FileTextDocument>(path, buffer.str());
}

FileTextDocument::Span FileTextDocument::resolve(const domain::TextRange& range) const {
    const int count = lineCount();
    if (range.startLine < 0 || range.endLine < 0 || range.startLine >= count || range.endLine >= count) {
        throw std::out_of_range("Line out of document bounds");
    }
    if (range.startColumn < 0 || range.endColumn < 0 || !range.isWellFormed()) {
        throw std::out_of_range("Invalid range");
    }
    const std::string& first = m_lines[range.startLine];
    const std::string& last = m_lines[range.endLine];
    Span span;
    span.startLine = range.startLine;
    span.startByte = TextUtils::ByteOffsetOf(first, static_cast<size_t>(range.startColumn));
    span.endLine = range.endLine;
    span.endByte = TextUtils::ByteOffsetOf(last, static_cast<size_t>(range.endColumn));
    if (span.startLine == span.endLine && span.endByte < span.startByte) {
        span.endByte = span.startByte;
    }
    return span;
}

std::string FileTextDocument::getText(const domain::TextRange& range) const {
    Span span = resolve(range);
    if (span.startLine == span.endLine) {
        return m_lines[span.startLine].substr(span.startByte, span.endByte - span.startByte);
    }
    std::string out = m_lines[span.startLine].substr(span.startByte);
    for (int line = span.startLine + 1; line < span.endLine; ++line) {
        out += "\n" + m_lines[line];
    }
    out += "\n" + m_lines[span.endLine].substr(0, span.endByte);
    return out;
}

bool FileTextDocument::replace(const domain::TextRange& range, const std::string& text) {
    Span span;
    try {
        span = resolve(range);
    } catch (const std::out_of_range& e) {
        std::cerr << "[FileTextDocument] Edit rejected: " << e.what() << std::endl;
        return false;
    }

    std::string merged = m_lines[span.startLine].substr(0, span.startByte) + text +
                         m_lines[span.endLine].substr(span.endByte);
    auto replacement = TextUtils::SplitLines(merged);

    auto first = m_lines.begin() + span.startLine;
    auto last = m_lines.begin() + span.endLine + 1;
    first = m_lines.erase(first, last);
    m_lines.insert(first, replacement.begin(), replacement.end());

    ++m_version;
    m_dirty = true;
    return true;
}

std::string FileTextDocument::content() const {
    std::string out;
    for (size_t i = 0; i < m_lines.size(); ++i) {
        if (i > 0) out += "\n";
        out += m_lines[i];
    }
    return out;
}

bool FileTextDocument::save() {
    fs::path finalPath = m_path;

    // Unique temp path: <file>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[FileTextDocument] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[FileTextDocument] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content();
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[FileTextDocument] Write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[FileTextDocument] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }

    m_dirty = false;
    return true;
}

FileEditorHost::FileEditorHost(std::shared_ptr<domain::TextDocument> active) : m_active(std::move(active)) {}

std::shared_ptr<FileTextDocument> FileEditorHost::open(const std::string& path) {
    auto document = FileTextDocument::Open(path);
    m_active = document;
    return document;
}

void FileEditorHost::setActive(std::shared_ptr<domain::TextDocument> document) {
    m_active = std::move(document);
}

void FileEditorHost::closeActive() {
    m_active.reset();
}

bool FileEditorHost::isWritable(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), W_OK) == 0;
}

} // namespace draftlens::infrastructure
