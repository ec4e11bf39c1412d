/**
 * @file ReviewPayloadParser.cpp
 * @brief Implementation of ReviewPayloadParser.
 */

#include "infrastructure/ReviewPayloadParser.hpp"
#include "infrastructure/CritiqueJson.hpp"
#include "domain/BackendError.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

namespace draftlens::infrastructure {

using json = nlohmann::json;
using domain::BackendError;
using domain::BackendErrorCode;

namespace {

constexpr const char* kDefaultOverall = "整体质量良好";
constexpr const char* kDefaultDiffSummary = "无明显变化";
constexpr double kDefaultRating = 7.0;

json ParseObject(const std::string& content, const std::string& what) {
    json parsed;
    try {
        parsed = json::parse(ReviewPayloadParser::StripCodeFences(content));
    } catch (const json::parse_error& e) {
        throw BackendError(BackendErrorCode::ParseError,
                           "Failed to parse " + what + " response: " + e.what());
    }
    if (!parsed.is_object()) {
        throw BackendError(BackendErrorCode::ParseError,
                           "Failed to parse " + what + " response: expected a JSON object");
    }
    return parsed;
}

std::optional<std::vector<std::string>> OptionalStringList(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_array()) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& item : j.at(key)) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

// Positions must be whole numbers that fit an int; anything else leaves the field unset.
std::optional<int> OptionalInt(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_number()) return std::nullopt;
    const double value = j.at(key).get<double>();
    if (!std::isfinite(value) || std::floor(value) != value) return std::nullopt;
    if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return std::nullopt;
}

domain::RawSuggestion ParseSuggestion(const json& item) {
    domain::RawSuggestion s;
    s.id = OptionalString(item, "id");
    // "type" is what the prompt asks for; some models answer with "kind".
    s.kind = OptionalString(item, "type").value_or(OptionalString(item, "kind").value_or(""));
    s.line = OptionalInt(item, "line");
    s.startLine = OptionalInt(item, "startLine");
    s.startColumn = OptionalInt(item, "startColumn");
    s.endLine = OptionalInt(item, "endLine");
    s.endColumn = OptionalInt(item, "endColumn");
    s.original = OptionalString(item, "original");
    s.suggested = OptionalString(item, "suggested");
    s.reason = OptionalString(item, "reason");
    return s;
}

} // namespace

std::string ReviewPayloadParser::StripCodeFences(const std::string& content) {
    std::string text = domain::TextUtils::Trim(content);
    if (text.rfind("```", 0) != 0) {
        return text;
    }
    auto firstNewline = text.find('\n');
    if (firstNewline == std::string::npos) {
        return text;
    }
    std::string body = text.substr(firstNewline + 1);
    auto closing = body.rfind("```");
    if (closing != std::string::npos) {
        body = body.substr(0, closing);
    }
    return domain::TextUtils::Trim(body);
}

domain::RawCritique ReviewPayloadParser::ParseTextReview(const std::string& content) {
    json parsed = ParseObject(content, "text review");

    domain::RawCritique raw;
    raw.overall = OptionalString(parsed, "overall");
    if (!raw.overall || domain::TextUtils::IsBlank(*raw.overall)) {
        raw.overall = kDefaultOverall;
    }
    raw.strengths = OptionalStringList(parsed, "strengths").value_or(std::vector<std::string>{});
    raw.improvements = OptionalStringList(parsed, "improvements").value_or(std::vector<std::string>{});
    if (parsed.contains("suggestions") && parsed.at("suggestions").is_array()) {
        for (const auto& item : parsed.at("suggestions")) {
            if (item.is_object()) raw.suggestions.push_back(ParseSuggestion(item));
        }
    }
    if (parsed.contains("rating") && parsed.at("rating").is_number()) {
        raw.rating = parsed.at("rating").get<double>();
    } else {
        raw.rating = kDefaultRating;
    }
    return raw;
}

domain::DiffAnalysis ReviewPayloadParser::ParseDiffAnalysis(const std::string& content, const std::string& diffText) {
    json parsed = ParseObject(content, "diff analysis");

    domain::DiffAnalysis analysis = CritiqueJson::DiffAnalysisFromJson(parsed);
    DiffLineCounts counts = CountDiffLines(diffText);
    analysis.additions = counts.additions;
    analysis.deletions = counts.deletions;
    analysis.modifications = std::min(counts.additions, counts.deletions);
    if (domain::TextUtils::IsBlank(analysis.summary)) {
        analysis.summary = kDefaultDiffSummary;
    }
    if (!analysis.impact) {
        analysis.impact = "minor";
    }
    return analysis;
}

DiffLineCounts ReviewPayloadParser::CountDiffLines(const std::string& diffText) {
    DiffLineCounts counts;
    for (const auto& line : domain::TextUtils::SplitLines(diffText)) {
        if (line.rfind("+++", 0) == 0 || line.rfind("---", 0) == 0) continue;
        if (!line.empty() && line[0] == '+') {
            ++counts.additions;
        } else if (!line.empty() && line[0] == '-') {
            ++counts.deletions;
        }
    }
    return counts;
}

} // namespace draftlens::infrastructure
