/**
 * @file DiffAnalysis.hpp
 * @brief Pre-computed diff/consistency report consumed by the review pipeline.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace draftlens::domain {

enum class ChangeType {
    Addition,
    Deletion,
    Modification
};

inline std::string ChangeTypeToString(ChangeType type) {
    switch (type) {
        case ChangeType::Addition: return "addition";
        case ChangeType::Deletion: return "deletion";
        case ChangeType::Modification: return "modification";
    }
    return "modification";
}

inline ChangeType ChangeTypeFromString(const std::string& type) {
    if (type == "addition") return ChangeType::Addition;
    if (type == "deletion") return ChangeType::Deletion;
    return ChangeType::Modification;
}

struct SemanticChange {
    ChangeType type = ChangeType::Modification;
    std::string description; ///< Literal changed text for additions and deletions.
    int lineNumber = 0;      ///< Approximate zero-based line in the revised document.
    double confidence = 0.0;
};

struct ConsistencyReport {
    int score = 0; ///< 0..100
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;
};

struct DiffAnalysis {
    std::string summary;
    int additions = 0;
    int deletions = 0;
    int modifications = 0;
    std::vector<SemanticChange> semanticChanges;
    ConsistencyReport consistencyReport;
    std::optional<std::string> impact; ///< "minor", "moderate" or "major".
    std::vector<std::string> structuralChanges;
    std::vector<std::string> toneChanges;
};

} // namespace draftlens::domain
