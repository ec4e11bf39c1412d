#include "infrastructure/PromptCatalog.hpp"
#include "domain/TextUtils.hpp"
#include <sstream>

namespace draftlens::infrastructure {

std::string PromptCatalog::GetSystemPrompt() {
    return "You are a professional writing assistant specializing in document analysis and review.";
}

std::string PromptCatalog::BuildTextReviewPrompt(const std::string& text, const domain::ReviewContext& context) {
    std::ostringstream numbered;
    auto lines = domain::TextUtils::SplitLines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) numbered << "\n";
        numbered << (i + 1) << ": " << lines[i];
    }

    std::ostringstream prompt;
    prompt << "You are a professional writing editor. Review the following text and provide detailed feedback.\n\n";
    prompt << "Document Type: " << context.documentType << "\n";
    prompt << "Writing Style: " << context.writingStyle << "\n";
    if (context.targetAudience) {
        prompt << "Target Audience: " << *context.targetAudience << "\n";
    }
    prompt << "\nText to Review (with line numbers):\n```\n" << numbered.str() << "\n```\n\n";
    prompt <<
        "IMPORTANT: The text above has line numbers prepended (e.g., \"1: \", \"2: \"). When providing suggestions:\n"
        "- \"line\" is the line number shown (1-based, for display)\n"
        "- \"startLine\" and \"endLine\" are 0-based (line number - 1)\n"
        "- \"startColumn\" and \"endColumn\" are 0-based character positions in the ORIGINAL line, without the prefix\n"
        "- \"original\" is the exact text from the document, without line numbers\n"
        "- \"suggested\" is the recommended replacement\n\n"
        "Answer in the primary language of the text.\n"
        "Rating (0-10): start from 7, add 0.5-1.0 for each strength, subtract 0.5-1.0 for each problem. "
        "Explain the score briefly in \"overall\".\n\n"
        "Respond with JSON in this structure:\n"
        "{\n"
        "  \"overall\": \"overall assessment with score explanation\",\n"
        "  \"strengths\": [\"...\"],\n"
        "  \"improvements\": [\"...\"],\n"
        "  \"rating\": 0-10,\n"
        "  \"suggestions\": [\n"
        "    {\n"
        "      \"id\": \"unique-id\",\n"
        "      \"type\": \"grammar|style|structure|content|clarity\",\n"
        "      \"line\": 1,\n"
        "      \"startLine\": 0,\n"
        "      \"startColumn\": 0,\n"
        "      \"endLine\": 0,\n"
        "      \"endColumn\": 0,\n"
        "      \"original\": \"exact text\",\n"
        "      \"suggested\": \"replacement\",\n"
        "      \"reason\": \"explanation\"\n"
        "    }\n"
        "  ]\n"
        "}\n\n"
        "Review for grammar and spelling, clarity, style consistency, structure and flow, and content quality.\n"
        "Respond ONLY with valid JSON.";
    return prompt.str();
}

std::string PromptCatalog::BuildDiffAnalysisPrompt(const std::string& diffText, const domain::AnalysisContext& context) {
    std::ostringstream prompt;
    prompt << "You are analyzing changes in a document. Analyze the following git diff and provide a detailed analysis.\n\n";
    prompt << "Document Type: " << context.documentType.value_or("unknown") << "\n";
    prompt << "File Path: " << context.filePath.value_or("unknown") << "\n\n";
    prompt << "Git Diff:\n```\n" << diffText << "\n```\n\n";
    prompt <<
        "Respond with JSON in this structure:\n"
        "{\n"
        "  \"summary\": \"brief summary of the changes in Chinese\",\n"
        "  \"semanticChanges\": [\n"
        "    {\"type\": \"addition|deletion|modification\", \"description\": \"changed text\", "
        "\"lineNumber\": 0, \"confidence\": 0.0}\n"
        "  ],\n"
        "  \"structuralChanges\": [\"headings, sections\"],\n"
        "  \"toneChanges\": [\"tone or style changes\"],\n"
        "  \"impact\": \"minor|moderate|major\",\n"
        "  \"consistencyReport\": {\"score\": 0-100, \"issues\": [\"...\"], \"suggestions\": [\"...\"]}\n"
        "}\n\n"
        "Focus on semantic meaning rather than line counts.\n"
        "Respond ONLY with valid JSON.";
    return prompt.str();
}

} // namespace draftlens::infrastructure
