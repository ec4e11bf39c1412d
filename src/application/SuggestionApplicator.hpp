/**
 * @file SuggestionApplicator.hpp
 * @brief Applies positioned suggestions to the active document.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Critique.hpp"
#include "domain/TextDocument.hpp"

namespace draftlens::application {

enum class ApplyOutcome {
    Applied,
    NoActiveEditor,
    WrongFile,
    AccessError,
    OutOfBounds,
    Stale,
    EditRejected,
    EditFailed,
    NotFound,
    NotAppliable ///< Informational suggestion: nothing to write.
};

std::string ApplyOutcomeToString(ApplyOutcome outcome);

/**
 * @struct ApplyResult
 * @brief Outcome of one apply attempt. Failures never throw.
 */
struct ApplyResult {
    bool success = false;
    std::string suggestionId;
    ApplyOutcome outcome = ApplyOutcome::EditFailed;
    std::string message;
    std::optional<std::string> error; ///< Underlying exception text, when there was one.

    static ApplyResult Success(const std::string& id);
    static ApplyResult Failure(const std::string& id, ApplyOutcome outcome, const std::string& message,
                               std::optional<std::string> error = std::nullopt);
};

struct BatchApplyResult {
    std::vector<ApplyResult> results;
    int successCount = 0;
    int failureCount = 0;
};

/**
 * @class SuggestionApplicator
 * @brief Conflict-checked, bottom-to-top application of suggestions.
 */
class SuggestionApplicator {
public:
    /** @brief (1-based index, total, suggestion about to be applied) */
    using ProgressCallback = std::function<void(int, int, const domain::Suggestion&)>;

    explicit SuggestionApplicator(std::shared_ptr<domain::EditorHost> host,
                                  std::chrono::milliseconds settleDelay = std::chrono::milliseconds(50));

    /**
     * @brief Applies one suggestion after the file, access and conflict gates.
     *
     * Informational suggestions (blank replacementText) are refused with NotAppliable.
     * The document is only touched when the live text under the anchor equals
     * the suggestion's originalText.
     */
    ApplyResult applyOne(const domain::Suggestion& suggestion);

    /**
     * @brief Applies suggestions bottom-to-top, right-to-left, stopping at the first failure.
     *
     * Informational suggestions are dropped before sorting and are neither attempted
     * nor reported. Suggestions after the failing one are neither attempted nor reported.
     */
    BatchApplyResult applyAll(const std::vector<domain::Suggestion>& suggestions,
                              const ProgressCallback& onProgress = nullptr);

    /** @brief Stable sort by startLine desc, then startColumn desc. */
    static std::vector<domain::Suggestion> SortForApplication(std::vector<domain::Suggestion> suggestions);

    /**
     * @brief Builds a suggestion with a fresh UUID.
     * @throws std::invalid_argument when the anchor is malformed.
     */
    static domain::Suggestion CreateSuggestion(domain::SuggestionKind kind, const domain::TextRange& anchor,
                                               const std::string& originalText, const std::string& replacementText,
                                               const std::string& rationale,
                                               const std::optional<std::string>& filePath = std::nullopt);

    /** @brief True when @p suggestionPath equals or is a suffix of @p documentPath, separators normalized to '/'. */
    static bool IsTargetFile(const std::string& documentPath, const std::string& suggestionPath);

private:
    std::shared_ptr<domain::EditorHost> m_host;
    std::chrono::milliseconds m_settleDelay;
};

} // namespace draftlens::application
