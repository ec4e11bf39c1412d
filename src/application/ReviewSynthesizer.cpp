/**
 * @file ReviewSynthesizer.cpp
 * @brief Implementation of ReviewSynthesizer.
 */

#include "application/ReviewSynthesizer.hpp"
#include "application/ReviewHeuristics.hpp"
#include "domain/BackendError.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/UuidGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>

namespace draftlens::application {

using domain::TextUtils;

namespace {

constexpr size_t kMaxScannedChanges = 5;
constexpr double kDefaultBackendRating = 7.0;

std::vector<std::string> NonBlank(const std::optional<std::vector<std::string>>& items) {
    std::vector<std::string> out;
    if (!items) return out;
    for (const auto& item : *items) {
        if (!TextUtils::IsBlank(item)) out.push_back(item);
    }
    return out;
}

std::string IntensifierRationale(const std::string& text) {
    bool hasHen = text.find("很") != std::string::npos;
    bool hasFeichang = text.find("非常") != std::string::npos;
    if (hasHen && hasFeichang) return ReviewPhrases::kIntensifierBoth;
    if (hasHen) return ReviewPhrases::kIntensifierHen;
    if (hasFeichang) return ReviewPhrases::kIntensifierFeichang;
    return ReviewPhrases::kIntensifierGeneric;
}

/** Anchor of a raw suggestion, or nullopt when it cannot be positioned. */
std::optional<domain::TextRange> RawAnchor(const domain::RawSuggestion& raw) {
    std::optional<int> startLine = raw.startLine;
    if (!startLine && raw.line && *raw.line > 0) {
        startLine = *raw.line - 1;
    }
    if (!startLine || !raw.startColumn || !raw.endColumn) {
        return std::nullopt;
    }
    domain::TextRange range;
    range.startLine = *startLine;
    range.startColumn = *raw.startColumn;
    range.endLine = raw.endLine.value_or(*startLine);
    range.endColumn = *raw.endColumn;
    if (!range.isWellFormed()) {
        return std::nullopt;
    }
    return range;
}

} // namespace

ReviewSynthesizer::ReviewSynthesizer(std::unique_ptr<domain::BackendAdapter> adapter, StatusCallback statusCallback)
    : m_adapter(std::move(adapter)), m_statusCallback(std::move(statusCallback)) {}

InitializationResult ReviewSynthesizer::initialize(const infrastructure::AppConfig& config,
                                                   const domain::CredentialStore& credentials,
                                                   std::shared_ptr<infrastructure::RateLimiterRegistry> registry) {
    infrastructure::ProviderResolver resolver(std::move(registry));
    infrastructure::ProviderResolution resolution = resolver.resolve(config, credentials);

    InitializationResult result;
    result.status = resolution.status;
    result.providerId = resolution.providerId;
    result.message = resolution.message;
    if (resolution.isReady()) {
        m_adapter = std::move(resolution.adapter);
    }
    return result;
}

void ReviewSynthesizer::setAdapter(std::unique_ptr<domain::BackendAdapter> adapter) {
    m_adapter = std::move(adapter);
}

// A failing status callback must not abort the review.
void ReviewSynthesizer::report(const std::string& message) const {
    if (!m_statusCallback) return;
    try {
        m_statusCallback(message);
    } catch (const std::exception& e) {
        std::cerr << "[ReviewSynthesizer] Status callback failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[ReviewSynthesizer] Status callback failed" << std::endl;
    }
}

domain::Critique ReviewSynthesizer::generateReview(const domain::DiffAnalysis& analysis,
                                                   const std::optional<std::string>& filePath,
                                                   const std::optional<std::string>& fullText,
                                                   const std::optional<int>& documentVersion) {
    m_lastProvenance = ReviewProvenance{};

    if (m_adapter && fullText) {
        try {
            report("Requesting review from " + m_adapter->providerName() + "...");
            domain::ReviewContext context;
            context.filePath = filePath;
            context.documentType = DocumentTypeFor(filePath);
            context.writingStyle = "formal";

            auto response = m_adapter->reviewText(*fullText, context);
            std::cout << "[ReviewSynthesizer] Backend review completed (model: " << response.modelId << ")"
                      << std::endl;

            m_lastProvenance.fromBackend = true;
            m_lastProvenance.modelId = response.modelId;
            m_lastProvenance.tokenUsage = response.tokenUsage;
            report("Review ready.");
            return NormalizeBackendCritique(response.data, filePath, documentVersion);
        } catch (const domain::BackendError& e) {
            m_lastProvenance = ReviewProvenance{};
            m_lastProvenance.fallbackReason =
                domain::BackendErrorCodeToString(e.code()) + std::string(": ") + e.what();
        } catch (const std::exception& e) {
            m_lastProvenance = ReviewProvenance{};
            m_lastProvenance.fallbackReason = e.what();
        } catch (...) {
            m_lastProvenance = ReviewProvenance{};
            m_lastProvenance.fallbackReason = "Unknown backend failure";
        }
        std::cerr << "[ReviewSynthesizer] Backend review failed, falling back to rule-based review: "
                  << m_lastProvenance.fallbackReason << std::endl;
    } else {
        m_lastProvenance.fallbackReason = !m_adapter ? "No backend configured" : "No content provided";
        std::cout << "[ReviewSynthesizer] Using rule-based review (" << m_lastProvenance.fallbackReason << ")"
                  << std::endl;
    }

    report("Building rule-based review...");
    return BuildFallbackCritique(analysis, filePath, fullText, documentVersion);
}

domain::Critique ReviewSynthesizer::NormalizeBackendCritique(const domain::RawCritique& raw,
                                                             const std::optional<std::string>& filePath,
                                                             const std::optional<int>& documentVersion) {
    domain::Critique critique;
    critique.sourcePath = filePath;
    critique.documentVersion = documentVersion;

    critique.overallAssessment = raw.overall && !TextUtils::IsBlank(*raw.overall)
                                     ? *raw.overall
                                     : std::string(ReviewPhrases::kPlaceholderOverall);
    critique.strengths = NonBlank(raw.strengths);
    if (critique.strengths.empty()) critique.strengths.push_back(ReviewPhrases::kPlaceholderStrength);
    critique.improvements = NonBlank(raw.improvements);
    if (critique.improvements.empty()) critique.improvements.push_back(ReviewPhrases::kPlaceholderImprovement);

    double rating = raw.rating.value_or(kDefaultBackendRating);
    if (!std::isfinite(rating)) rating = kDefaultBackendRating;
    critique.rating = std::clamp(static_cast<int>(std::floor(rating + 0.5)), 0, 10);

    std::set<std::string> usedIds;
    for (const auto& rawSuggestion : raw.suggestions) {
        domain::Suggestion s;
        if (rawSuggestion.id && !TextUtils::IsBlank(*rawSuggestion.id) && !usedIds.count(*rawSuggestion.id)) {
            s.id = *rawSuggestion.id;
        } else {
            s.id = infrastructure::UuidGenerator::Generate();
        }
        usedIds.insert(s.id);

        s.kind = domain::KindFromString(rawSuggestion.kind);
        s.rationale = rawSuggestion.reason && !TextUtils::IsBlank(*rawSuggestion.reason)
                          ? *rawSuggestion.reason
                          : std::string(ReviewPhrases::kPlaceholderRationale);
        s.filePath = filePath;
        s.documentVersionAtProposal = documentVersion;

        if (auto anchor = RawAnchor(rawSuggestion)) {
            s.anchor = *anchor;
            s.displayLine = rawSuggestion.line && *rawSuggestion.line > 0 ? *rawSuggestion.line
                                                                          : anchor->startLine + 1;
            s.originalText = rawSuggestion.original.value_or("");
            s.replacementText = rawSuggestion.suggested.value_or("");
        }
        // Otherwise informational: zero anchor, no original, no replacement.
        critique.suggestions.push_back(s);
    }
    return critique;
}

domain::Critique ReviewSynthesizer::BuildFallbackCritique(const domain::DiffAnalysis& analysis,
                                                          const std::optional<std::string>& filePath,
                                                          const std::optional<std::string>& fullText,
                                                          const std::optional<int>& documentVersion) {
    domain::Critique critique;
    critique.sourcePath = filePath;
    critique.documentVersion = documentVersion;
    const auto& consistency = analysis.consistencyReport;

    std::vector<std::string> strengths;
    if (consistency.score >= 80) strengths.push_back(ReviewPhrases::kStrengthStructure);
    if (analysis.additions > analysis.deletions * 2) strengths.push_back(ReviewPhrases::kStrengthExpansion);
    if (analysis.semanticChanges.size() > 5) strengths.push_back(ReviewPhrases::kStrengthDetail);

    std::vector<std::string> improvements = consistency.issues;

    for (const auto& text : consistency.suggestions) {
        domain::Suggestion s;
        s.id = infrastructure::UuidGenerator::Generate();
        s.kind = domain::SuggestionKind::Style;
        s.rationale = TextUtils::IsBlank(text) ? std::string(ReviewPhrases::kPlaceholderRationale) : text;
        s.filePath = filePath;
        s.documentVersionAtProposal = documentVersion;
        critique.suggestions.push_back(s);
    }

    const std::string content = fullText.value_or("");
    const size_t scanned = std::min(kMaxScannedChanges, analysis.semanticChanges.size());
    for (size_t i = 0; i < scanned; ++i) {
        const auto& change = analysis.semanticChanges[i];
        if (change.type != domain::ChangeType::Addition) continue;
        if (!ReviewHeuristics::ContainsIntensifier(change.description)) continue;

        domain::Suggestion s;
        s.id = infrastructure::UuidGenerator::Generate();
        s.kind = domain::SuggestionKind::Style;
        s.anchor = ReviewHeuristics::LocateText(content, change.description, change.lineNumber);
        s.displayLine = change.lineNumber + 1;
        s.originalText = change.description;
        s.replacementText = ReviewHeuristics::StripIntensifiers(change.description);
        s.rationale = IntensifierRationale(change.description);
        s.filePath = filePath;
        s.documentVersionAtProposal = documentVersion;
        critique.suggestions.push_back(s);
    }

    std::string overall;
    if (consistency.score >= 85) {
        overall = ReviewPhrases::kOverallExcellent;
    } else if (consistency.score >= 70) {
        overall = ReviewPhrases::kOverallGood;
    } else {
        overall = ReviewPhrases::kOverallNeedsWork;
    }
    if (analysis.additions > 0 && analysis.deletions == 0) {
        overall += ReviewPhrases::kClausePureAddition;
    } else if (analysis.deletions > analysis.additions) {
        overall += ReviewPhrases::kClauseCondensed;
    }
    critique.overallAssessment = overall;

    critique.rating = ComputeFallbackRating(consistency.score, strengths.size(), improvements.size());

    critique.strengths = strengths.empty() ? std::vector<std::string>{ReviewPhrases::kPlaceholderStrength} : strengths;
    critique.improvements =
        improvements.empty() ? std::vector<std::string>{ReviewPhrases::kPlaceholderImprovement} : improvements;
    return critique;
}

int ReviewSynthesizer::ComputeFallbackRating(int score, size_t strengthCount, size_t improvementCount) {
    double raw = score / 10.0 + 0.5 * static_cast<double>(strengthCount) - 0.3 * static_cast<double>(improvementCount);
    return std::clamp(static_cast<int>(std::floor(raw + 0.5)), 0, 10);
}

std::string ReviewSynthesizer::DocumentTypeFor(const std::optional<std::string>& filePath) {
    if (!filePath) return "markdown";
    std::string extension = std::filesystem::path(*filePath).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (extension == ".tex") {
        return "latex";
    }
    return "markdown";
}

} // namespace draftlens::application
