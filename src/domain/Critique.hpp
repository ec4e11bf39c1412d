/**
 * @file Critique.hpp
 * @brief Canonical review result and the positioned suggestions it carries.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/TextRange.hpp"

namespace draftlens::domain {

/**
 * @enum SuggestionKind
 * @brief Display classification of a suggestion. Never affects application.
 */
enum class SuggestionKind {
    Grammar,
    Style,
    Structure,
    Content
};

inline std::string KindToString(SuggestionKind kind) {
    switch (kind) {
        case SuggestionKind::Grammar: return "grammar";
        case SuggestionKind::Style: return "style";
        case SuggestionKind::Structure: return "structure";
        case SuggestionKind::Content: return "content";
    }
    return "style";
}

/** @brief Maps backend kind strings into the closed set; "clarity" and unknown kinds become Style. */
inline SuggestionKind KindFromString(const std::string& kind) {
    if (kind == "grammar") return SuggestionKind::Grammar;
    if (kind == "structure") return SuggestionKind::Structure;
    if (kind == "content") return SuggestionKind::Content;
    return SuggestionKind::Style;
}

/**
 * @struct Suggestion
 * @brief A single positioned edit proposal.
 *
 * Immutable once created; applied state lives in application::ReviewSession.
 */
struct Suggestion {
    std::string id;
    SuggestionKind kind = SuggestionKind::Style;
    TextRange anchor;
    int displayLine = 0;              ///< 1-based line for presentation, 0 when not positioned.
    std::string originalText;
    std::string replacementText;      ///< Empty after trim means informational only.
    std::string rationale;
    std::optional<std::string> filePath;
    std::optional<int> documentVersionAtProposal;

    /** @brief True when the suggestion carries an actual text change usable by bulk apply. */
    bool isAppliable() const;
};

/**
 * @struct Critique
 * @brief Normalized review of a revision.
 *
 * Invariants: overallAssessment, strengths and improvements are never empty;
 * rating is in [0, 10].
 */
struct Critique {
    std::string overallAssessment;
    std::vector<std::string> strengths;
    std::vector<std::string> improvements;
    std::vector<Suggestion> suggestions;
    int rating = 0;
    std::optional<std::string> sourcePath;
    std::optional<int> documentVersion;

    /** @brief Looks up a suggestion by id. */
    const Suggestion* findSuggestion(const std::string& id) const {
        for (const auto& s : suggestions) {
            if (s.id == id) return &s;
        }
        return nullptr;
    }
};

} // namespace draftlens::domain
