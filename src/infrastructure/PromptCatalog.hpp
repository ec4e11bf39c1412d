/**
 * @file PromptCatalog.hpp
 * @brief Central storage for backend prompts.
 */

#pragma once

#include <string>
#include "domain/BackendAdapter.hpp"

namespace draftlens::infrastructure {

class PromptCatalog {
public:
    /** @brief System message shared by every provider. */
    static std::string GetSystemPrompt();

    /** @brief Review prompt with 1-based line numbers prepended to each line of @p text. */
    static std::string BuildTextReviewPrompt(const std::string& text, const domain::ReviewContext& context);

    static std::string BuildDiffAnalysisPrompt(const std::string& diffText, const domain::AnalysisContext& context);
};

} // namespace draftlens::infrastructure
