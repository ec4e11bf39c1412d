#include <cassert>
#include <iostream>
#include <memory>
#include "application/ReviewSession.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/FileTextDocument.hpp"

using namespace draftlens;
using application::ApplyOutcome;
using application::ReviewSession;
using application::SuggestionApplicator;
using infrastructure::FileTextDocument;

class MockEditorHost : public domain::EditorHost {
public:
    explicit MockEditorHost(std::shared_ptr<domain::TextDocument> doc) : document(std::move(doc)) {}
    std::shared_ptr<domain::TextDocument> activeDocument() override { return document; }
    bool isWritable(const std::string&) const override { return true; }

    std::shared_ptr<domain::TextDocument> document;
};

static domain::Suggestion MakeSuggestion(const std::string& id, int line, const std::string& original,
                                         const std::string& replacement) {
    domain::Suggestion s;
    s.id = id;
    s.anchor = {line, 0, line, static_cast<int>(domain::TextUtils::CodePointLength(original))};
    s.displayLine = line + 1;
    s.originalText = original;
    s.replacementText = replacement;
    s.rationale = "test";
    return s;
}

static domain::Critique MakeCritique() {
    domain::Critique critique;
    critique.overallAssessment = "ok";
    critique.strengths = {"s"};
    critique.improvements = {"i"};
    critique.rating = 7;
    critique.suggestions.push_back(MakeSuggestion("a", 0, "很好", "好"));
    critique.suggestions.push_back(MakeSuggestion("b", 1, "非常快", "快"));
    domain::Suggestion info;
    info.id = "info";
    info.rationale = "整体结构可以再调整";
    critique.suggestions.push_back(info);
    critique.suggestions.push_back(MakeSuggestion("c", 2, "很长", "长"));
    return critique;
}

int main() {
    std::cout << "[Test] Starting ReviewSession Test..." << std::endl;

    auto doc = std::make_shared<FileTextDocument>("ch1.md", "很好\n非常快\n很长");
    auto host = std::make_shared<MockEditorHost>(doc);
    SuggestionApplicator applicator(host, std::chrono::milliseconds(0));
    ReviewSession session(MakeCritique());

    assert(session.appliableSuggestions().size() == 3 && "Informational suggestions are not appliable.");

    // Unknown id
    auto missing = session.applyById("nope", applicator);
    assert(!missing.success);
    assert(missing.outcome == ApplyOutcome::NotFound);
    std::cout << "[PASS] unknown id is NotFound" << std::endl;

    // Apply one by id
    auto applied = session.applyById("b", applicator);
    assert(applied.success);
    assert(session.isApplied("b"));
    assert(doc->content() == "很好\n快\n很长");
    assert(session.appliableSuggestions().size() == 2);
    std::cout << "[PASS] apply by id" << std::endl;

    // Selected batch with an unknown id touches nothing
    auto rejected = session.applySelected({"a", "ghost"}, applicator);
    assert(rejected.results.size() == 1);
    assert(rejected.results[0].outcome == ApplyOutcome::NotFound);
    assert(rejected.results[0].suggestionId == "ghost");
    assert(rejected.failureCount == 1);
    assert(doc->content() == "很好\n快\n很长");
    std::cout << "[PASS] applySelected rejects unknown ids up front" << std::endl;

    auto informational = session.applySelected({"a", "info"}, applicator);
    assert(informational.results.size() == 1);
    assert(informational.results[0].outcome == ApplyOutcome::NotAppliable);
    assert(informational.results[0].suggestionId == "info");
    assert(informational.successCount == 0 && informational.failureCount == 1);
    assert(!session.isApplied("info") && !session.isApplied("a"));
    assert(doc->content() == "很好\n快\n很长");

    auto byId = session.applyById("info", applicator);
    assert(!byId.success);
    assert(byId.outcome == ApplyOutcome::NotAppliable);
    assert(!session.isApplied("info"));
    std::cout << "[PASS] informational suggestions are never applied" << std::endl;

    // Remaining skips applied and informational suggestions
    int progressCalls = 0;
    auto remaining = session.applyRemaining(applicator, [&progressCalls](int, int total, const domain::Suggestion& s) {
        assert(total == 2);
        assert(s.id != "b" && s.id != "info");
        ++progressCalls;
    });
    assert(remaining.successCount == 2);
    assert(remaining.failureCount == 0);
    assert(progressCalls == 2);
    assert(doc->content() == "好\n快\n长");
    assert(session.isApplied("a") && session.isApplied("c"));
    assert(!session.isApplied("info"));
    assert(session.appliableSuggestions().empty());
    assert(session.appliedCount() == 3);
    std::cout << "[PASS] applyRemaining skips applied and informational" << std::endl;

    std::cout << "[Test] ReviewSession Test completed." << std::endl;
    return 0;
}
