#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "application/ReviewSynthesizer.hpp"
#include "domain/BackendError.hpp"

using namespace draftlens;
namespace ReviewPhrases = application::ReviewPhrases;
using application::ReviewSynthesizer;

// Mock backend: either returns a scripted critique or throws.
class MockBackendAdapter : public domain::BackendAdapter {
public:
    explicit MockBackendAdapter(bool fail) : m_fail(fail) {}

    domain::BackendResponse<domain::RawCritique> reviewText(const std::string& text,
                                                            const domain::ReviewContext& context) override {
        ++calls;
        lastText = text;
        lastContext = context;
        if (m_fail) {
            throw domain::BackendError(domain::BackendErrorCode::InvalidCredential, "Invalid API key", 401);
        }
        domain::RawCritique raw;
        raw.overall = "结构清晰";
        raw.strengths = std::vector<std::string>{"论证充分"};
        raw.rating = 8;
        domain::RawSuggestion s;
        s.id = "s1";
        s.kind = "grammar";
        s.line = 1;
        s.startColumn = 0;
        s.endColumn = 2;
        s.original = "很好";
        s.suggested = "好";
        s.reason = "精炼";
        raw.suggestions.push_back(s);
        return {raw, "mock-model", {10, 20, 30, 0.0}};
    }

    domain::BackendResponse<domain::DiffAnalysis> analyzeDiff(const std::string&,
                                                              const domain::AnalysisContext&) override {
        return {};
    }

    std::string providerName() const override { return "mock"; }
    std::string modelName() const override { return "mock-model"; }

    int calls = 0;
    std::string lastText;
    domain::ReviewContext lastContext;

private:
    bool m_fail;
};

// Throws something that is not a std::exception.
class OddlyFailingAdapter : public domain::BackendAdapter {
public:
    domain::BackendResponse<domain::RawCritique> reviewText(const std::string&, const domain::ReviewContext&) override {
        throw 42;
    }
    domain::BackendResponse<domain::DiffAnalysis> analyzeDiff(const std::string&,
                                                              const domain::AnalysisContext&) override {
        throw 42;
    }
    std::string providerName() const override { return "odd"; }
    std::string modelName() const override { return "odd-model"; }
};

static bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

static void assertCritiqueInvariants(const domain::Critique& critique) {
    assert(!critique.overallAssessment.empty());
    assert(!critique.strengths.empty());
    assert(!critique.improvements.empty());
    assert(critique.rating >= 0 && critique.rating <= 10);
    std::set<std::string> ids;
    for (const auto& s : critique.suggestions) {
        assert(!s.id.empty());
        assert(ids.insert(s.id).second && "Suggestion ids must be unique.");
        assert(!s.rationale.empty());
    }
}

static void testFallbackPureAddition() {
    domain::DiffAnalysis analysis;
    analysis.additions = 10;
    analysis.deletions = 0;
    analysis.consistencyReport.score = 90;

    auto critique = ReviewSynthesizer::BuildFallbackCritique(analysis, std::string("ch1.md"), std::nullopt);
    assertCritiqueInvariants(critique);
    assert(StartsWith(critique.overallAssessment, ReviewPhrases::kOverallExcellent));
    assert(critique.overallAssessment.find(ReviewPhrases::kClausePureAddition) != std::string::npos);
    assert(critique.strengths.size() == 2);
    assert(critique.improvements.size() == 1 && critique.improvements[0] == ReviewPhrases::kPlaceholderImprovement);
    assert(critique.rating == 10);
    assert(critique.suggestions.empty());
    std::cout << "[PASS] fallback pure addition" << std::endl;
}

static void testFallbackCondensedLowScore() {
    domain::DiffAnalysis analysis;
    analysis.additions = 1;
    analysis.deletions = 5;
    analysis.consistencyReport.score = 40;
    analysis.consistencyReport.issues = {"术语不统一", "段落过长"};
    analysis.consistencyReport.suggestions = {"统一术语"};

    auto critique = ReviewSynthesizer::BuildFallbackCritique(analysis, std::nullopt, std::nullopt);
    assertCritiqueInvariants(critique);
    assert(StartsWith(critique.overallAssessment, ReviewPhrases::kOverallNeedsWork));
    assert(critique.overallAssessment.find(ReviewPhrases::kClauseCondensed) != std::string::npos);
    assert(critique.strengths.size() == 1 && critique.strengths[0] == ReviewPhrases::kPlaceholderStrength);
    assert(critique.improvements.size() == 2);
    // 4.0 + 0 - 0.6 = 3.4
    assert(critique.rating == 3);

    assert(critique.suggestions.size() == 1);
    const auto& info = critique.suggestions[0];
    assert(info.rationale == "统一术语");
    assert(!info.isAppliable());
    assert(info.anchor == domain::TextRange{});
    std::cout << "[PASS] fallback condensed, low score" << std::endl;
}

static void testFallbackIntensifierSuggestion() {
    domain::DiffAnalysis analysis;
    analysis.additions = 1;
    analysis.consistencyReport.score = 75;
    domain::SemanticChange change;
    change.type = domain::ChangeType::Addition;
    change.description = "很好的开始";
    change.lineNumber = 1;
    analysis.semanticChanges.push_back(change);

    domain::SemanticChange deletion = change;
    deletion.type = domain::ChangeType::Deletion;
    analysis.semanticChanges.push_back(deletion);

    const std::string text = "标题\n很好的开始\n结尾";
    auto critique = ReviewSynthesizer::BuildFallbackCritique(analysis, std::string("ch1.md"), text, 4);
    assertCritiqueInvariants(critique);
    assert(StartsWith(critique.overallAssessment, ReviewPhrases::kOverallGood));

    assert(critique.suggestions.size() == 1 && "Deletions are never turned into suggestions.");
    const auto& s = critique.suggestions[0];
    assert(s.anchor == (domain::TextRange{1, 0, 1, 5}));
    assert(s.displayLine == 2);
    assert(s.originalText == "很好的开始");
    assert(s.replacementText == "好的开始");
    assert(s.rationale == ReviewPhrases::kIntensifierHen);
    assert(s.filePath && *s.filePath == "ch1.md");
    assert(s.documentVersionAtProposal && *s.documentVersionAtProposal == 4);
    assert(s.isAppliable());
    std::cout << "[PASS] fallback intensifier suggestion" << std::endl;
}

static void testFallbackRating() {
    assert(ReviewSynthesizer::ComputeFallbackRating(100, 3, 0) == 10);
    assert(ReviewSynthesizer::ComputeFallbackRating(0, 0, 10) == 0);
    // 7.0 + 0.5 - 0.3 = 7.2
    assert(ReviewSynthesizer::ComputeFallbackRating(70, 1, 1) == 7);
    // 6.5 rounds half up
    assert(ReviewSynthesizer::ComputeFallbackRating(65, 0, 0) == 7);
    std::cout << "[PASS] fallback rating" << std::endl;
}

static void testNormalizeBackendCritique() {
    domain::RawCritique raw;
    raw.rating = 12.6;
    raw.strengths = std::vector<std::string>{"  "};

    domain::RawSuggestion positioned;
    positioned.id = "dup";
    positioned.kind = "clarity";
    positioned.line = 3;
    positioned.startColumn = 1;
    positioned.endColumn = 4;
    positioned.original = "abc";
    positioned.suggested = "xyz";
    raw.suggestions.push_back(positioned);

    domain::RawSuggestion duplicate = positioned;
    raw.suggestions.push_back(duplicate);

    domain::RawSuggestion unpositioned;
    unpositioned.kind = "structure";
    unpositioned.line = 5;
    unpositioned.original = "ignored";
    unpositioned.suggested = "ignored";
    unpositioned.reason = "调整段落顺序";
    raw.suggestions.push_back(unpositioned);

    auto critique = ReviewSynthesizer::NormalizeBackendCritique(raw, std::string("docs/a.md"), 2);
    assertCritiqueInvariants(critique);
    assert(critique.rating == 10);
    assert(critique.overallAssessment == ReviewPhrases::kPlaceholderOverall);
    assert(critique.strengths[0] == ReviewPhrases::kPlaceholderStrength);

    assert(critique.suggestions.size() == 3);
    const auto& first = critique.suggestions[0];
    assert(first.id == "dup");
    assert(first.kind == domain::SuggestionKind::Style);
    assert(first.anchor == (domain::TextRange{2, 1, 2, 4}));
    assert(first.displayLine == 3);
    assert(first.rationale == ReviewPhrases::kPlaceholderRationale);
    assert(first.filePath && *first.filePath == "docs/a.md");

    assert(critique.suggestions[1].id != "dup");
    assert(critique.suggestions[1].id.size() == 36);

    const auto& info = critique.suggestions[2];
    assert(info.kind == domain::SuggestionKind::Structure);
    assert(info.originalText.empty() && info.replacementText.empty());
    assert(!info.isAppliable());
    assert(info.rationale == "调整段落顺序");

    raw.rating = -3;
    assert(ReviewSynthesizer::NormalizeBackendCritique(raw, std::nullopt).rating == 0);
    raw.rating.reset();
    assert(ReviewSynthesizer::NormalizeBackendCritique(raw, std::nullopt).rating == 7);
    std::cout << "[PASS] normalize backend critique" << std::endl;
}

static void testGenerateReviewUsesBackend() {
    auto adapter = std::make_unique<MockBackendAdapter>(false);
    MockBackendAdapter* mock = adapter.get();
    std::vector<std::string> statuses;
    ReviewSynthesizer synthesizer(std::move(adapter), [&statuses](std::string s) { statuses.push_back(s); });

    domain::DiffAnalysis analysis;
    auto critique = synthesizer.generateReview(analysis, std::string("paper.tex"), std::string("很好\n"), 3);
    assertCritiqueInvariants(critique);
    assert(mock->calls == 1);
    assert(mock->lastContext.documentType == "latex");
    assert(critique.overallAssessment == "结构清晰");
    assert(critique.rating == 8);
    assert(critique.suggestions.size() == 1);
    assert(critique.suggestions[0].kind == domain::SuggestionKind::Grammar);
    assert(critique.documentVersion && *critique.documentVersion == 3);

    const auto& provenance = synthesizer.lastProvenance();
    assert(provenance.fromBackend);
    assert(provenance.modelId == "mock-model");
    assert(provenance.tokenUsage.totalTokens == 30);
    assert(!statuses.empty());
    std::cout << "[PASS] generateReview uses backend" << std::endl;
}

static void testGenerateReviewFallsBack() {
    auto adapter = std::make_unique<MockBackendAdapter>(true);
    MockBackendAdapter* mock = adapter.get();
    ReviewSynthesizer synthesizer(std::move(adapter));

    domain::DiffAnalysis analysis;
    analysis.additions = 10;
    analysis.consistencyReport.score = 90;
    auto critique = synthesizer.generateReview(analysis, std::string("a.md"), std::string("text"));
    assertCritiqueInvariants(critique);
    assert(mock->calls == 1);
    assert(StartsWith(critique.overallAssessment, ReviewPhrases::kOverallExcellent));
    assert(!synthesizer.lastProvenance().fromBackend);
    assert(synthesizer.lastProvenance().fallbackReason.find("INVALID_CREDENTIAL") != std::string::npos);

    // Without content the backend is not consulted at all.
    synthesizer.generateReview(analysis, std::string("a.md"));
    assert(mock->calls == 1);

    ReviewSynthesizer offline;
    assert(!offline.hasBackend());
    auto offlineCritique = offline.generateReview(analysis);
    assertCritiqueInvariants(offlineCritique);
    assert(offline.lastProvenance().fallbackReason == "No backend configured");
    std::cout << "[PASS] generateReview falls back" << std::endl;
}

static void testGenerateReviewNeverThrows() {
    domain::DiffAnalysis analysis;
    analysis.additions = 3;
    analysis.consistencyReport.score = 75;

    ReviewSynthesizer synthesizer(std::make_unique<OddlyFailingAdapter>());
    auto critique = synthesizer.generateReview(analysis, std::string("a.md"), std::string("text"));
    assertCritiqueInvariants(critique);
    assert(StartsWith(critique.overallAssessment, ReviewPhrases::kOverallGood));
    assert(!synthesizer.lastProvenance().fromBackend);
    assert(synthesizer.lastProvenance().fallbackReason == "Unknown backend failure");

    int statusCalls = 0;
    ReviewSynthesizer noisy(std::make_unique<MockBackendAdapter>(false), [&statusCalls](std::string) {
        ++statusCalls;
        throw std::runtime_error("status sink closed");
    });
    auto fromBackend = noisy.generateReview(analysis, std::string("a.md"), std::string("很好"));
    assert(statusCalls >= 1);
    assert(noisy.lastProvenance().fromBackend && "A failing status callback does not force the fallback.");
    assert(fromBackend.rating == 8);
    std::cout << "[PASS] generateReview never throws" << std::endl;
}

static void testDocumentTypeFor() {
    assert(ReviewSynthesizer::DocumentTypeFor(std::string("paper/main.tex")) == "latex");
    assert(ReviewSynthesizer::DocumentTypeFor(std::string("paper/Chapter.TEX")) == "latex");
    assert(ReviewSynthesizer::DocumentTypeFor(std::string("notes.md")) == "markdown");
    assert(ReviewSynthesizer::DocumentTypeFor(std::string("tex")) == "markdown");
    assert(ReviewSynthesizer::DocumentTypeFor(std::nullopt) == "markdown");
    std::cout << "[PASS] document type from extension" << std::endl;
}

int main() {
    std::cout << "[Test] Starting ReviewSynthesizer Test..." << std::endl;
    testFallbackPureAddition();
    testFallbackCondensedLowScore();
    testFallbackIntensifierSuggestion();
    testFallbackRating();
    testNormalizeBackendCritique();
    testGenerateReviewUsesBackend();
    testGenerateReviewFallsBack();
    testGenerateReviewNeverThrows();
    testDocumentTypeFor();
    std::cout << "[Test] ReviewSynthesizer Test completed." << std::endl;
    return 0;
}
