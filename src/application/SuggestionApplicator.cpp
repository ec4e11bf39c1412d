/**
 * @file SuggestionApplicator.cpp
 * @brief Implementation of SuggestionApplicator.
 */

#include "application/SuggestionApplicator.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/UuidGenerator.hpp"
#include <algorithm>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace draftlens::application {

namespace {

constexpr const char* kNoActiveEditor = "No active document to apply the suggestion to.";
constexpr const char* kOutOfBounds = "Line numbers are out of document bounds. The document may have been modified.";
constexpr const char* kInvalidRange = "Invalid range or position in document.";
constexpr const char* kStale = "The text at this location has changed since the review was generated.";
constexpr const char* kEditRejected = "The editor rejected the edit.";
constexpr const char* kNotAppliable = "The suggestion has no replacement text to apply.";

} // namespace

std::string ApplyOutcomeToString(ApplyOutcome outcome) {
    switch (outcome) {
        case ApplyOutcome::Applied: return "applied";
        case ApplyOutcome::NoActiveEditor: return "no-active-editor";
        case ApplyOutcome::WrongFile: return "wrong-file";
        case ApplyOutcome::AccessError: return "access-error";
        case ApplyOutcome::OutOfBounds: return "out-of-bounds";
        case ApplyOutcome::Stale: return "stale";
        case ApplyOutcome::EditRejected: return "edit-rejected";
        case ApplyOutcome::EditFailed: return "edit-failed";
        case ApplyOutcome::NotFound: return "not-found";
        case ApplyOutcome::NotAppliable: return "not-appliable";
    }
    return "unknown";
}

ApplyResult ApplyResult::Success(const std::string& id) {
    ApplyResult r;
    r.success = true;
    r.suggestionId = id;
    r.outcome = ApplyOutcome::Applied;
    r.message = "Suggestion applied.";
    return r;
}

ApplyResult ApplyResult::Failure(const std::string& id, ApplyOutcome outcome, const std::string& message,
                                 std::optional<std::string> error) {
    ApplyResult r;
    r.success = false;
    r.suggestionId = id;
    r.outcome = outcome;
    r.message = message;
    r.error = std::move(error);
    return r;
}

SuggestionApplicator::SuggestionApplicator(std::shared_ptr<domain::EditorHost> host,
                                           std::chrono::milliseconds settleDelay)
    : m_host(std::move(host)), m_settleDelay(settleDelay) {}

bool SuggestionApplicator::IsTargetFile(const std::string& documentPath, const std::string& suggestionPath) {
    using domain::TextUtils;
    std::string doc = TextUtils::NormalizeSeparators(documentPath);
    std::string target = TextUtils::NormalizeSeparators(suggestionPath);
    if (doc == target) return true;
    if (target.empty() || doc.empty()) return false;
    return TextUtils::EndsWith(doc, target);
}

ApplyResult SuggestionApplicator::applyOne(const domain::Suggestion& suggestion) {
    const std::string& id = suggestion.id;
    if (!suggestion.isAppliable()) {
        return ApplyResult::Failure(id, ApplyOutcome::NotAppliable, kNotAppliable);
    }

    std::shared_ptr<domain::TextDocument> document = m_host ? m_host->activeDocument() : nullptr;
    if (!document) {
        return ApplyResult::Failure(id, ApplyOutcome::NoActiveEditor, kNoActiveEditor);
    }

    const std::string documentPath = document->path();
    if (suggestion.filePath && !IsTargetFile(documentPath, *suggestion.filePath)) {
        return ApplyResult::Failure(id, ApplyOutcome::WrongFile,
                                    "Suggestion targets " + *suggestion.filePath + " but the active document is " +
                                        documentPath + ".");
    }

    if (!m_host->isWritable(documentPath)) {
        return ApplyResult::Failure(id, ApplyOutcome::AccessError,
                                    "Cannot write to " + documentPath + " (missing or permission denied).");
    }

    const domain::TextRange& anchor = suggestion.anchor;
    const int lineCount = document->lineCount();
    if (anchor.startLine >= lineCount || anchor.endLine >= lineCount) {
        return ApplyResult::Failure(id, ApplyOutcome::OutOfBounds, kOutOfBounds);
    }
    if (!anchor.isWellFormed()) {
        return ApplyResult::Failure(id, ApplyOutcome::OutOfBounds, kInvalidRange);
    }

    std::string liveText;
    try {
        liveText = document->getText(anchor);
    } catch (const std::exception& e) {
        return ApplyResult::Failure(id, ApplyOutcome::OutOfBounds, kInvalidRange, std::string(e.what()));
    }

    if (liveText != suggestion.originalText) {
        return ApplyResult::Failure(id, ApplyOutcome::Stale, kStale);
    }

    try {
        if (!document->replace(anchor, suggestion.replacementText)) {
            return ApplyResult::Failure(id, ApplyOutcome::EditRejected, kEditRejected);
        }
    } catch (const std::exception& e) {
        std::cerr << "[SuggestionApplicator] Edit failed for " << id << ": " << e.what() << std::endl;
        return ApplyResult::Failure(id, ApplyOutcome::EditFailed, "Failed to apply the edit.", std::string(e.what()));
    }

    return ApplyResult::Success(id);
}

BatchApplyResult SuggestionApplicator::applyAll(const std::vector<domain::Suggestion>& suggestions,
                                                const ProgressCallback& onProgress) {
    BatchApplyResult batch;
    std::vector<domain::Suggestion> appliable;
    std::copy_if(suggestions.begin(), suggestions.end(), std::back_inserter(appliable),
                 [](const domain::Suggestion& s) { return s.isAppliable(); });
    std::vector<domain::Suggestion> ordered = SortForApplication(std::move(appliable));
    const int total = static_cast<int>(ordered.size());

    for (int i = 0; i < total; ++i) {
        const auto& suggestion = ordered[i];
        if (onProgress) onProgress(i + 1, total, suggestion);

        ApplyResult result = applyOne(suggestion);
        batch.results.push_back(result);
        if (!result.success) {
            ++batch.failureCount;
            std::cerr << "[SuggestionApplicator] Stopping batch at " << suggestion.id << ": " << result.message
                      << std::endl;
            break;
        }
        ++batch.successCount;

        if (i + 1 < total && m_settleDelay.count() > 0) {
            std::this_thread::sleep_for(m_settleDelay);
        }
    }
    return batch;
}

std::vector<domain::Suggestion> SuggestionApplicator::SortForApplication(std::vector<domain::Suggestion> suggestions) {
    std::stable_sort(suggestions.begin(), suggestions.end(), [](const auto& a, const auto& b) {
        if (a.anchor.startLine != b.anchor.startLine) {
            return a.anchor.startLine > b.anchor.startLine;
        }
        return a.anchor.startColumn > b.anchor.startColumn;
    });
    return suggestions;
}

domain::Suggestion SuggestionApplicator::CreateSuggestion(domain::SuggestionKind kind, const domain::TextRange& anchor,
                                                          const std::string& originalText,
                                                          const std::string& replacementText,
                                                          const std::string& rationale,
                                                          const std::optional<std::string>& filePath) {
    if (!anchor.isWellFormed()) {
        throw std::invalid_argument("Suggestion anchor must start before it ends");
    }
    if (domain::TextUtils::IsBlank(rationale)) {
        throw std::invalid_argument("Suggestion rationale must not be empty");
    }
    domain::Suggestion s;
    s.id = infrastructure::UuidGenerator::Generate();
    s.kind = kind;
    s.anchor = anchor;
    s.displayLine = anchor.startLine + 1;
    s.originalText = originalText;
    s.replacementText = replacementText;
    s.rationale = rationale;
    s.filePath = filePath;
    return s;
}

} // namespace draftlens::application
