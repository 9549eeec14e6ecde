/**
 * @file CaseJsonParser.hpp
 * @brief Converts a validated case document into a CaseDefinition.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/CaseDefinition.hpp"

namespace casefile::infrastructure {

class CaseJsonParser {
public:
    /**
     * @brief Builds the domain model from JSON.
     *
     * Expects a document that passed CaseValidator. Optional fields fall back
     * to their defaults; a case without investigation_points gets
     * defaultInvestigationPoints and a case without start_location starts in
     * its first location.
     *
     * @throws nlohmann::json::exception on type mismatches the validator does not cover.
     */
    static domain::CaseDefinition Parse(const nlohmann::json& caseJson, int defaultInvestigationPoints = 12);

    /** @brief Parses one requirement node (and its children). */
    static domain::Requirement ParseRequirement(const nlohmann::json& req);
};

} // namespace casefile::infrastructure
