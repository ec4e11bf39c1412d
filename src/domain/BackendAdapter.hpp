/**
 * @file BackendAdapter.hpp
 * @brief Interface for reasoning backends that critique text and analyze diffs.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/DiffAnalysis.hpp"

namespace draftlens::domain {

/**
 * @struct ReviewContext
 * @brief Hints passed along with the text under review.
 */
struct ReviewContext {
    std::optional<std::string> filePath;
    std::string documentType = "markdown"; ///< "markdown" or "latex".
    std::string writingStyle = "formal";   ///< "formal", "casual", "academic" or "technical".
    std::optional<std::string> targetAudience;
};

struct AnalysisContext {
    std::optional<std::string> filePath;
    std::optional<std::string> documentType;
};

struct TokenUsage {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
    double estimatedCost = 0.0; ///< USD
};

/**
 * @struct RawSuggestion
 * @brief Suggestion exactly as a backend returned it. Every field may be absent.
 */
struct RawSuggestion {
    std::optional<std::string> id;
    std::string kind;
    std::optional<int> line;
    std::optional<int> startLine;
    std::optional<int> startColumn;
    std::optional<int> endLine;
    std::optional<int> endColumn;
    std::optional<std::string> original;
    std::optional<std::string> suggested;
    std::optional<std::string> reason;
};

/**
 * @struct RawCritique
 * @brief Backend review before normalization into domain::Critique.
 */
struct RawCritique {
    std::optional<std::string> overall;
    std::optional<std::vector<std::string>> strengths;
    std::optional<std::vector<std::string>> improvements;
    std::vector<RawSuggestion> suggestions;
    std::optional<double> rating;
};

template <typename T>
struct BackendResponse {
    T data;
    std::string modelId;
    TokenUsage tokenUsage;
};

/**
 * @class BackendAdapter
 * @brief Abstract capability wrapping one reasoning backend.
 *
 * Implementations throw domain::BackendError on failure.
 */
class BackendAdapter {
public:
    virtual ~BackendAdapter() = default;

    /**
     * @brief Reviews a full document text.
     * @param text Complete document content.
     * @param context Document type, style and provenance hints.
     * @return Raw critique plus the model that produced it.
     */
    virtual BackendResponse<RawCritique> reviewText(const std::string& text, const ReviewContext& context) = 0;

    /**
     * @brief Extracts semantic changes and a consistency report from a unified diff.
     */
    virtual BackendResponse<DiffAnalysis> analyzeDiff(const std::string& diffText,
                                                      const AnalysisContext& context = {}) = 0;

    /** @brief Logical backend identity, also the admission controller key. */
    virtual std::string providerName() const = 0;

    virtual std::string modelName() const = 0;
};

} // namespace draftlens::domain
