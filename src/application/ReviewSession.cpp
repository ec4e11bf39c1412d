/**
 * @file ReviewSession.cpp
 * @brief Implementation of ReviewSession.
 */

#include "application/ReviewSession.hpp"
#include <iostream>

namespace draftlens::application {

ReviewSession::ReviewSession(domain::Critique critique) : m_critique(std::move(critique)) {}

std::vector<domain::Suggestion> ReviewSession::appliableSuggestions() const {
    std::vector<domain::Suggestion> out;
    for (const auto& s : m_critique.suggestions) {
        if (s.isAppliable() && !isApplied(s.id)) out.push_back(s);
    }
    return out;
}

ApplyResult ReviewSession::applyById(const std::string& id, SuggestionApplicator& applicator) {
    const domain::Suggestion* suggestion = m_critique.findSuggestion(id);
    if (!suggestion) {
        return ApplyResult::Failure(id, ApplyOutcome::NotFound, "Suggestion not found: " + id);
    }
    ApplyResult result = applicator.applyOne(*suggestion);
    if (result.success) m_applied.insert(id);
    return result;
}

BatchApplyResult ReviewSession::applySelected(const std::vector<std::string>& ids, SuggestionApplicator& applicator,
                                              const SuggestionApplicator::ProgressCallback& onProgress) {
    std::vector<domain::Suggestion> selected;
    for (const auto& id : ids) {
        const domain::Suggestion* suggestion = m_critique.findSuggestion(id);
        if (!suggestion) {
            BatchApplyResult batch;
            batch.results.push_back(ApplyResult::Failure(id, ApplyOutcome::NotFound, "Suggestion not found: " + id));
            batch.failureCount = 1;
            return batch;
        }
        if (!suggestion->isAppliable()) {
            BatchApplyResult batch;
            batch.results.push_back(ApplyResult::Failure(id, ApplyOutcome::NotAppliable,
                                                         "Suggestion has no replacement text: " + id));
            batch.failureCount = 1;
            return batch;
        }
        selected.push_back(*suggestion);
    }
    BatchApplyResult batch = applicator.applyAll(selected, onProgress);
    record(batch);
    return batch;
}

BatchApplyResult ReviewSession::applyRemaining(SuggestionApplicator& applicator,
                                               const SuggestionApplicator::ProgressCallback& onProgress) {
    std::vector<domain::Suggestion> remaining = appliableSuggestions();
    std::cout << "[ReviewSession] Applying " << remaining.size() << " remaining suggestion(s)" << std::endl;
    BatchApplyResult batch = applicator.applyAll(remaining, onProgress);
    record(batch);
    return batch;
}

void ReviewSession::record(const BatchApplyResult& batch) {
    for (const auto& result : batch.results) {
        if (result.success) m_applied.insert(result.suggestionId);
    }
}

} // namespace draftlens::application
