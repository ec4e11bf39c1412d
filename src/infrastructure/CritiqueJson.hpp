/**
 * @file CritiqueJson.hpp
 * @brief JSON mapping for Critique and DiffAnalysis.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/Critique.hpp"
#include "domain/DiffAnalysis.hpp"

namespace draftlens::infrastructure {

class CritiqueJson {
public:
    static nlohmann::json ToJson(const domain::Critique& critique);

    /**
     * @brief Reads a persisted critique. Every suggestion needs an id and an anchor object.
     * @throws nlohmann::json::exception on missing or mistyped required fields.
     * @throws std::invalid_argument on a malformed anchor.
     */
    static domain::Critique CritiqueFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::DiffAnalysis& analysis);

    /** @brief Lenient read: absent or mistyped fields keep their defaults. */
    static domain::DiffAnalysis DiffAnalysisFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::SemanticChange& change);
    static domain::SemanticChange SemanticChangeFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::ConsistencyReport& report);
    static domain::ConsistencyReport ConsistencyReportFromJson(const nlohmann::json& j);
};

} // namespace draftlens::infrastructure
