/**
 * @file ReviewSession.hpp
 * @brief One Critique plus the ids of the suggestions already applied from it.
 */

#pragma once

#include <set>
#include <string>
#include <vector>
#include "application/SuggestionApplicator.hpp"
#include "domain/Critique.hpp"

namespace draftlens::application {

class ReviewSession {
public:
    explicit ReviewSession(domain::Critique critique);

    const domain::Critique& critique() const { return m_critique; }

    /** @brief Suggestions with a non-blank replacement that have not been applied yet. */
    std::vector<domain::Suggestion> appliableSuggestions() const;

    ApplyResult applyById(const std::string& id, SuggestionApplicator& applicator);

    /**
     * @brief Applies the given ids as one batch.
     *
     * An unknown id yields a single NotFound result, and an informational one a single
     * NotAppliable result. Either way the document is left untouched.
     */
    BatchApplyResult applySelected(const std::vector<std::string>& ids, SuggestionApplicator& applicator,
                                   const SuggestionApplicator::ProgressCallback& onProgress = nullptr);

    BatchApplyResult applyRemaining(SuggestionApplicator& applicator,
                                    const SuggestionApplicator::ProgressCallback& onProgress = nullptr);

    bool isApplied(const std::string& id) const { return m_applied.count(id) > 0; }
    size_t appliedCount() const { return m_applied.size(); }

private:
    void record(const BatchApplyResult& batch);

    domain::Critique m_critique;
    std::set<std::string> m_applied;
};

} // namespace draftlens::application
