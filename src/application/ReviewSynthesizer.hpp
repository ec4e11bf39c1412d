/**
 * @file ReviewSynthesizer.hpp
 * @brief Produces a Critique from a backend review or, failing that, from diff statistics.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "domain/BackendAdapter.hpp"
#include "domain/CredentialStore.hpp"
#include "domain/Critique.hpp"
#include "domain/DiffAnalysis.hpp"
#include "infrastructure/AppConfig.hpp"
#include "infrastructure/ProviderResolver.hpp"
#include "infrastructure/RateLimiter.hpp"

namespace draftlens::application {

/** @brief Fixed texts of the offline review. */
namespace ReviewPhrases {
constexpr const char* kStrengthStructure = "文本结构清晰，逻辑连贯";
constexpr const char* kStrengthExpansion = "内容扩充充分，信息量丰富";
constexpr const char* kStrengthDetail = "修改细致，注重细节打磨";

constexpr const char* kOverallExcellent = "本次修改整体质量优秀，文本逻辑清晰，表达流畅。";
constexpr const char* kOverallGood = "本次修改整体质量良好，有一些小问题需要注意。";
constexpr const char* kOverallNeedsWork = "本次修改存在一些需要改进的地方，建议仔细审查。";
constexpr const char* kClausePureAddition = "主要是内容扩充，注意保持与现有内容的一致性。";
constexpr const char* kClauseCondensed = "进行了内容精简，注意不要删除关键信息。";

constexpr const char* kPlaceholderOverall = "整体质量良好";
constexpr const char* kPlaceholderStrength = "继续保持细致的写作态度";
constexpr const char* kPlaceholderImprovement = "暂无明显问题";
constexpr const char* kPlaceholderRationale = "建议修改此处以提升表达质量";

constexpr const char* kIntensifierBoth =
    "减少\"很\"、\"非常\"等程度副词的使用可以使文字更精炼（将移除文本中所有\"很\"和\"非常\"）";
constexpr const char* kIntensifierHen = "减少\"很\"等程度副词的使用可以使文字更精炼（将移除文本中所有\"很\"）";
constexpr const char* kIntensifierFeichang =
    "减少\"非常\"等程度副词的使用可以使文字更精炼（将移除文本中所有\"非常\"）";
constexpr const char* kIntensifierGeneric = "减少程度副词的使用可以使文字更精炼";
} // namespace ReviewPhrases

/**
 * @struct ReviewProvenance
 * @brief How the last Critique was produced.
 */
struct ReviewProvenance {
    bool fromBackend = false;
    std::string modelId;
    domain::TokenUsage tokenUsage;
    std::string fallbackReason; ///< Empty when the backend answered.
};

/**
 * @struct InitializationResult
 * @brief Outcome of ReviewSynthesizer::initialize. Reporting is left to the caller.
 */
struct InitializationResult {
    infrastructure::ResolutionStatus status = infrastructure::ResolutionStatus::CredentialMissing;
    std::string providerId;
    std::string message;

    bool ready() const { return status == infrastructure::ResolutionStatus::Ready; }
};

/**
 * @class ReviewSynthesizer
 * @brief Orchestrates "try backend, else fall back".
 */
class ReviewSynthesizer {
public:
    using StatusCallback = std::function<void(std::string)>;

    explicit ReviewSynthesizer(std::unique_ptr<domain::BackendAdapter> adapter = nullptr,
                               StatusCallback statusCallback = nullptr);

    /**
     * @brief Resolves the configured provider and installs its adapter when ready.
     *
     * Leaves the current adapter untouched unless resolution succeeds.
     */
    InitializationResult initialize(const infrastructure::AppConfig& config,
                                    const domain::CredentialStore& credentials,
                                    std::shared_ptr<infrastructure::RateLimiterRegistry> registry);

    void setAdapter(std::unique_ptr<domain::BackendAdapter> adapter);
    bool hasBackend() const { return m_adapter != nullptr; }
    void setStatusCallback(StatusCallback statusCallback) { m_statusCallback = std::move(statusCallback); }

    /**
     * @brief Builds a Critique. Never throws.
     * @param analysis Upstream diff/consistency report.
     * @param filePath Document the review is about; copied into every suggestion.
     * @param fullText Current document content. The backend is only consulted when present.
     * @param documentVersion Version of the document the review was computed against.
     */
    domain::Critique generateReview(const domain::DiffAnalysis& analysis,
                                    const std::optional<std::string>& filePath = std::nullopt,
                                    const std::optional<std::string>& fullText = std::nullopt,
                                    const std::optional<int>& documentVersion = std::nullopt);

    const ReviewProvenance& lastProvenance() const { return m_lastProvenance; }

    /** @brief Maps a raw backend critique onto the canonical shape and its invariants. */
    static domain::Critique NormalizeBackendCritique(const domain::RawCritique& raw,
                                                     const std::optional<std::string>& filePath,
                                                     const std::optional<int>& documentVersion = std::nullopt);

    /** @brief Deterministic critique derived from @p analysis alone. */
    static domain::Critique BuildFallbackCritique(const domain::DiffAnalysis& analysis,
                                                  const std::optional<std::string>& filePath,
                                                  const std::optional<std::string>& fullText,
                                                  const std::optional<int>& documentVersion = std::nullopt);

    /** @brief clamp(round-half-up(score/10 + 0.5*strengths - 0.3*improvements), 0, 10) */
    static int ComputeFallbackRating(int score, size_t strengthCount, size_t improvementCount);

    /** @brief "latex" for .tex files, otherwise "markdown". */
    static std::string DocumentTypeFor(const std::optional<std::string>& filePath);

private:
    void report(const std::string& message) const;

    std::unique_ptr<domain::BackendAdapter> m_adapter;
    StatusCallback m_statusCallback;
    ReviewProvenance m_lastProvenance;
};

} // namespace draftlens::application
