/**
 * @file CritiqueJson.cpp
 * @brief Implementation of CritiqueJson.
 */

#include "infrastructure/CritiqueJson.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace draftlens::infrastructure {

using json = nlohmann::json;

namespace {

std::vector<std::string> StringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j.at(key).is_array()) return out;
    for (const auto& item : j.at(key)) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

int IntOr(const json& j, const char* key, int fallback) {
    if (!j.contains(key) || !j.at(key).is_number()) return fallback;
    const double value = j.at(key).get<double>();
    if (!std::isfinite(value) || value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        return fallback;
    }
    return static_cast<int>(value);
}

std::string StringOr(const json& j, const char* key, const std::string& fallback) {
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return fallback;
}

} // namespace

json CritiqueJson::ToJson(const domain::Critique& critique) {
    json suggestions = json::array();
    for (const auto& s : critique.suggestions) {
        json item = {
            {"id", s.id},
            {"kind", domain::KindToString(s.kind)},
            {"anchor", {
                {"startLine", s.anchor.startLine},
                {"startColumn", s.anchor.startColumn},
                {"endLine", s.anchor.endLine},
                {"endColumn", s.anchor.endColumn}
            }},
            {"displayLine", s.displayLine},
            {"originalText", s.originalText},
            {"replacementText", s.replacementText},
            {"rationale", s.rationale}
        };
        if (s.filePath) item["filePath"] = *s.filePath;
        if (s.documentVersionAtProposal) item["documentVersionAtProposal"] = *s.documentVersionAtProposal;
        suggestions.push_back(item);
    }

    json j = {
        {"overallAssessment", critique.overallAssessment},
        {"strengths", critique.strengths},
        {"improvements", critique.improvements},
        {"suggestions", suggestions},
        {"rating", critique.rating}
    };
    if (critique.sourcePath) j["sourcePath"] = *critique.sourcePath;
    if (critique.documentVersion) j["documentVersion"] = *critique.documentVersion;
    return j;
}

domain::Critique CritiqueJson::CritiqueFromJson(const json& j) {
    domain::Critique critique;
    critique.overallAssessment = j.at("overallAssessment").get<std::string>();
    critique.strengths = j.at("strengths").get<std::vector<std::string>>();
    critique.improvements = j.at("improvements").get<std::vector<std::string>>();
    critique.rating = j.at("rating").get<int>();
    if (j.contains("sourcePath")) critique.sourcePath = j.at("sourcePath").get<std::string>();
    if (j.contains("documentVersion")) critique.documentVersion = j.at("documentVersion").get<int>();

    if (j.contains("suggestions")) {
        for (const auto& item : j.at("suggestions")) {
            domain::Suggestion s;
            s.id = item.at("id").get<std::string>();
            s.kind = domain::KindFromString(item.value("kind", "style"));
            const auto& anchor = item.at("anchor");
            s.anchor.startLine = anchor.at("startLine").get<int>();
            s.anchor.startColumn = anchor.at("startColumn").get<int>();
            s.anchor.endLine = anchor.at("endLine").get<int>();
            s.anchor.endColumn = anchor.at("endColumn").get<int>();
            if (!s.anchor.isWellFormed()) {
                throw std::invalid_argument("Malformed anchor for suggestion " + s.id);
            }
            s.displayLine = item.value("displayLine", 0);
            s.originalText = item.value("originalText", "");
            s.replacementText = item.value("replacementText", "");
            s.rationale = item.value("rationale", "");
            if (item.contains("filePath")) s.filePath = item.at("filePath").get<std::string>();
            if (item.contains("documentVersionAtProposal")) {
                s.documentVersionAtProposal = item.at("documentVersionAtProposal").get<int>();
            }
            critique.suggestions.push_back(s);
        }
    }
    return critique;
}

json CritiqueJson::ToJson(const domain::SemanticChange& change) {
    return {
        {"type", domain::ChangeTypeToString(change.type)},
        {"description", change.description},
        {"lineNumber", change.lineNumber},
        {"confidence", change.confidence}
    };
}

domain::SemanticChange CritiqueJson::SemanticChangeFromJson(const json& j) {
    domain::SemanticChange change;
    change.type = domain::ChangeTypeFromString(StringOr(j, "type", "modification"));
    change.description = StringOr(j, "description", "");
    change.lineNumber = IntOr(j, "lineNumber", 0);
    if (j.contains("confidence") && j.at("confidence").is_number()) {
        change.confidence = j.at("confidence").get<double>();
    }
    return change;
}

json CritiqueJson::ToJson(const domain::ConsistencyReport& report) {
    return {
        {"score", report.score},
        {"issues", report.issues},
        {"suggestions", report.suggestions}
    };
}

domain::ConsistencyReport CritiqueJson::ConsistencyReportFromJson(const json& j) {
    domain::ConsistencyReport report;
    report.score = IntOr(j, "score", 80);
    report.issues = StringList(j, "issues");
    report.suggestions = StringList(j, "suggestions");
    return report;
}

json CritiqueJson::ToJson(const domain::DiffAnalysis& analysis) {
    json changes = json::array();
    for (const auto& change : analysis.semanticChanges) {
        changes.push_back(ToJson(change));
    }
    json j = {
        {"summary", analysis.summary},
        {"additions", analysis.additions},
        {"deletions", analysis.deletions},
        {"modifications", analysis.modifications},
        {"semanticChanges", changes},
        {"consistencyReport", ToJson(analysis.consistencyReport)},
        {"structuralChanges", analysis.structuralChanges},
        {"toneChanges", analysis.toneChanges}
    };
    if (analysis.impact) j["impact"] = *analysis.impact;
    return j;
}

domain::DiffAnalysis CritiqueJson::DiffAnalysisFromJson(const json& j) {
    domain::DiffAnalysis analysis;
    if (!j.is_object()) return analysis;

    analysis.summary = StringOr(j, "summary", "");
    analysis.additions = IntOr(j, "additions", 0);
    analysis.deletions = IntOr(j, "deletions", 0);
    analysis.modifications = IntOr(j, "modifications", 0);
    if (j.contains("semanticChanges") && j.at("semanticChanges").is_array()) {
        for (const auto& item : j.at("semanticChanges")) {
            if (item.is_object()) analysis.semanticChanges.push_back(SemanticChangeFromJson(item));
        }
    }
    if (j.contains("consistencyReport") && j.at("consistencyReport").is_object()) {
        analysis.consistencyReport = ConsistencyReportFromJson(j.at("consistencyReport"));
    } else {
        analysis.consistencyReport.score = 80;
    }
    if (j.contains("impact") && j.at("impact").is_string()) {
        analysis.impact = j.at("impact").get<std::string>();
    }
    analysis.structuralChanges = StringList(j, "structuralChanges");
    analysis.toneChanges = StringList(j, "toneChanges");
    return analysis;
}

} // namespace draftlens::infrastructure
