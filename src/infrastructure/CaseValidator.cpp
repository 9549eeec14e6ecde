/**
 * @file CaseValidator.cpp
 * @brief Implementation of the case validation gate.
 */

#include "infrastructure/CaseValidator.hpp"
#include "domain/Requirement.hpp"
#include "domain/Verdict.hpp"
#include "domain/rules/UnlockEvaluator.hpp"
#include "domain/rules/WitnessRules.hpp"

#include <algorithm>
#include <set>

namespace casefile::infrastructure {

namespace {

bool IsNonEmptyString(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty();
}

std::string StringOr(const nlohmann::json& j, const char* key, const std::string& fallback) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool HasUsableTrigger(const nlohmann::json& entry) {
    if (!entry.contains("triggers") || !entry["triggers"].is_array()) return false;
    for (const auto& t : entry["triggers"]) {
        if (t.is_string() && !t.get<std::string>().empty()) return true;
    }
    return false;
}

/** Collects ids from an array of objects, reporting missing and duplicate ids. */
std::vector<std::string> CollectIds(const nlohmann::json& items,
                                    const std::string& what,
                                    std::vector<std::string>& errors) {
    std::vector<std::string> ids;
    std::set<std::string> seen;
    for (const auto& item : items) {
        if (!item.is_object() || !IsNonEmptyString(item, "id")) {
            errors.push_back(what + " entry without id.");
            continue;
        }
        const std::string id = item["id"].get<std::string>();
        if (!seen.insert(id).second) {
            errors.push_back("Duplicate " + what + " id '" + id + "'.");
            continue;
        }
        ids.push_back(id);
    }
    return ids;
}

const nlohmann::json& ArrayOrEmpty(const nlohmann::json& j, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    if (j.contains(key) && j[key].is_array()) return j[key];
    return kEmpty;
}

void CheckStringList(const nlohmann::json& j,
                     const char* key,
                     const std::vector<std::string>& known,
                     const std::string& context,
                     std::vector<std::string>& errors) {
    for (const auto& item : ArrayOrEmpty(j, key)) {
        if (!item.is_string()) {
            errors.push_back(context + ": '" + key + "' must contain strings.");
            continue;
        }
        const std::string id = item.get<std::string>();
        if (!Contains(known, id)) {
            errors.push_back(context + " references unknown evidence '" + id + "'.");
        }
    }
}

} // namespace

void CaseValidator::ValidateRequirement(const nlohmann::json& req,
                                        const std::string& hypothesisId,
                                        const std::vector<std::string>& evidenceIds,
                                        int depth,
                                        Result& result) const {
    const std::string where = "Hypothesis '" + hypothesisId + "'";
    if (depth > domain::rules::UnlockEvaluator::kMaxDepth) {
        result.errors.push_back(where + ": requirement nesting is deeper than " +
                                std::to_string(domain::rules::UnlockEvaluator::kMaxDepth) + " levels.");
        return;
    }
    if (!req.is_object() || !IsNonEmptyString(req, "type")) {
        result.errors.push_back(where + ": requirement without type.");
        return;
    }

    const std::string type = req["type"].get<std::string>();
    if (type == "evidence_collected") {
        const std::string id = req.contains("evidence_id") ? StringOr(req, "evidence_id", "")
                                                           : StringOr(req, "evidenceId", "");
        if (id.empty()) {
            result.errors.push_back(where + ": evidence_collected without evidence_id.");
        } else if (!Contains(evidenceIds, id)) {
            result.errors.push_back(where + ": requirement references unknown evidence '" + id + "'.");
        }
    } else if (type == "threshold_met") {
        if (!req.contains("threshold") || !req["threshold"].is_number_integer()) {
            result.errors.push_back(where + ": threshold_met without integer threshold.");
        }
        const std::string metric = StringOr(req, "metric", "");
        if (!domain::MetricFromString(metric)) {
            result.warnings.push_back(where + ": unknown metric '" + metric +
                                      "'; this threshold can never be met.");
        }
    } else if (type == "all_of" || type == "any_of") {
        if (!req.contains("requirements") || !req["requirements"].is_array()) {
            result.errors.push_back(where + ": " + type + " without requirements list.");
            return;
        }
        for (const auto& child : req["requirements"]) {
            ValidateRequirement(child, hypothesisId, evidenceIds, depth + 1, result);
        }
    } else {
        result.errors.push_back(where + ": unknown requirement type '" + type + "'.");
    }
}

CaseValidator::Result CaseValidator::Validate(const nlohmann::json& caseJson) const {
    Result result;
    auto& errors = result.errors;
    auto& warnings = result.warnings;

    if (!caseJson.is_object()) {
        errors.push_back("Case document must be a JSON object.");
        return result;
    }

    // A) Identity
    if (!IsNonEmptyString(caseJson, "id")) errors.push_back("Case has no id.");
    if (!IsNonEmptyString(caseJson, "title")) errors.push_back("Case has no title.");
    if (caseJson.contains("difficulty")) {
        const std::string difficulty = StringOr(caseJson, "difficulty", "");
        if (difficulty != "beginner" && difficulty != "intermediate" && difficulty != "advanced") {
            errors.push_back("Invalid difficulty '" + difficulty + "'.");
        }
    }
    if (caseJson.contains("investigation_points") &&
        (!caseJson["investigation_points"].is_number_integer() || caseJson["investigation_points"].get<int>() < 0)) {
        errors.push_back("investigation_points must be a non-negative integer.");
    }

    // B) Locations and evidence
    const auto& locations = ArrayOrEmpty(caseJson, "locations");
    if (locations.empty()) errors.push_back("Case has no locations.");
    const auto locationIds = CollectIds(locations, "location", errors);

    if (caseJson.contains("start_location")) {
        const std::string start = StringOr(caseJson, "start_location", "");
        if (!Contains(locationIds, start)) {
            errors.push_back("start_location '" + start + "' is not a location.");
        }
    }

    nlohmann::json allEvidence = nlohmann::json::array();
    for (const auto& loc : locations) {
        if (!loc.is_object()) continue;
        const std::string locId = StringOr(loc, "id", "?");
        for (const auto& ev : ArrayOrEmpty(loc, "evidence")) {
            allEvidence.push_back(ev);
            const std::string evId = ev.is_object() ? StringOr(ev, "id", "?") : "?";
            if (!ev.is_object()) continue;
            if (!HasUsableTrigger(ev)) {
                errors.push_back("Evidence '" + evId + "' has no triggers.");
            }
            if (ev.contains("strength")) {
                if (!ev["strength"].is_number_integer() || ev["strength"].get<int>() < 0 ||
                    ev["strength"].get<int>() > 100) {
                    errors.push_back("Evidence '" + evId + "' strength must be 0-100.");
                }
            }
            if (ev.contains("cost") && (!ev["cost"].is_number_integer() || ev["cost"].get<int>() < 0)) {
                errors.push_back("Evidence '" + evId + "' cost must be a non-negative integer.");
            }
        }
        for (const auto& np : ArrayOrEmpty(loc, "not_present")) {
            if (!np.is_object() || !IsNonEmptyString(np, "id")) {
                errors.push_back("Location '" + locId + "' has a not_present entry without id.");
            } else if (!HasUsableTrigger(np)) {
                warnings.push_back("Location '" + locId + "' not_present '" + np["id"].get<std::string>() +
                                   "' has no triggers and can never match.");
            }
        }
    }
    if (allEvidence.empty()) errors.push_back("Case has no evidence.");
    const auto evidenceIds = CollectIds(allEvidence, "evidence", errors);

    // C) Witnesses
    const auto& witnesses = ArrayOrEmpty(caseJson, "witnesses");
    const auto witnessIds = CollectIds(witnesses, "witness", errors);
    for (const auto& w : witnesses) {
        if (!w.is_object()) continue;
        const bool hasWants = IsNonEmptyString(w, "wants");
        const bool hasFears = IsNonEmptyString(w, "fears");
        if (hasWants != hasFears) {
            warnings.push_back("Witness '" + StringOr(w, "id", "?") + "' defines " +
                               (hasWants ? "wants without fears." : "fears without wants."));
        }
        if (w.contains("base_trust") &&
            (!w["base_trust"].is_number_integer() || w["base_trust"].get<int>() < 0 ||
             w["base_trust"].get<int>() > 100)) {
            errors.push_back("Witness '" + StringOr(w, "id", "?") + "' base_trust must be 0-100.");
        }

        const std::string witnessId = StringOr(w, "id", "?");
        std::set<std::string> secretIds;
        for (const auto& secret : ArrayOrEmpty(w, "secrets")) {
            if (!secret.is_object() || !IsNonEmptyString(secret, "id") || !IsNonEmptyString(secret, "text")) {
                errors.push_back("Witness '" + witnessId + "' has a secret without id or text.");
                continue;
            }
            const std::string secretId = secret["id"].get<std::string>();
            if (!secretIds.insert(secretId).second) {
                errors.push_back("Witness '" + witnessId + "' repeats secret id '" + secretId + "'.");
            }
            if (!IsNonEmptyString(secret, "trigger")) {
                warnings.push_back("Secret '" + secretId + "' of witness '" + witnessId +
                                   "' has no trigger and is never revealed.");
                continue;
            }
            std::vector<std::string> unparsed;
            const auto trigger = domain::rules::WitnessRules::parseTrigger(secret["trigger"].get<std::string>(), &unparsed);
            for (const auto& part : unparsed) {
                warnings.push_back("Secret '" + secretId + "' ignores trigger part '" + part + "'.");
            }
            for (const auto& group : trigger.anyOf) {
                for (const auto& condition : group) {
                    if (condition.kind == domain::SecretCondition::Kind::Evidence &&
                        !Contains(evidenceIds, condition.evidenceId)) {
                        errors.push_back("Secret '" + secretId + "' references unknown evidence '" +
                                         condition.evidenceId + "'.");
                    }
                }
            }
        }
        for (const auto& lie : ArrayOrEmpty(w, "lies")) {
            if (!lie.is_object() ||
                !domain::rules::WitnessRules::parseTrustCondition(StringOr(lie, "condition", ""))) {
                warnings.push_back("Witness '" + witnessId + "' has a lie without a trust condition; it is skipped.");
                continue;
            }
            bool hasTopic = false;
            for (const auto& topic : ArrayOrEmpty(lie, "topics")) {
                if (topic.is_string() && !topic.get<std::string>().empty()) hasTopic = true;
            }
            if (!hasTopic) {
                warnings.push_back("Witness '" + witnessId + "' has a lie with no topics; it never fires.");
            }
        }
    }

    // D) Timeline
    const auto& timeline = ArrayOrEmpty(caseJson, "timeline");
    const auto timelineIds = CollectIds(timeline, "timeline", errors);
    for (const auto& entry : timeline) {
        if (!entry.is_object()) continue;
        if (!IsNonEmptyString(entry, "time") || !IsNonEmptyString(entry, "event")) {
            errors.push_back("Timeline entry '" + StringOr(entry, "id", "?") + "' needs time and event.");
        }
    }
    for (const auto& ev : allEvidence) {
        if (!ev.is_object()) continue;
        for (const auto& claim : ArrayOrEmpty(ev, "implies_sequence")) {
            const std::string earlier = StringOr(claim, "earlier", "");
            const std::string later = StringOr(claim, "later", "");
            if (!Contains(timelineIds, earlier) || !Contains(timelineIds, later)) {
                errors.push_back("Evidence '" + StringOr(ev, "id", "?") +
                                 "' implies a sequence over unknown timeline events.");
            }
        }
    }

    // E) Hypotheses
    const auto& hypotheses = ArrayOrEmpty(caseJson, "hypotheses");
    CollectIds(hypotheses, "hypothesis", errors);
    for (const auto& h : hypotheses) {
        if (!h.is_object()) continue;
        const std::string hId = StringOr(h, "id", "?");
        const int tier = (h.contains("tier") && h["tier"].is_number_integer()) ? h["tier"].get<int>() : 1;
        if (tier != 1 && tier != 2) {
            errors.push_back("Hypothesis '" + hId + "' has tier " + std::to_string(tier) + "; expected 1 or 2.");
            continue;
        }
        const bool hasRequirement = h.contains("requirement") && !h["requirement"].is_null();
        if (tier == 2 && !hasRequirement) {
            errors.push_back("Tier-2 hypothesis '" + hId + "' has no requirement.");
        } else if (tier == 1 && hasRequirement) {
            warnings.push_back("Tier-1 hypothesis '" + hId + "' has a requirement; it is ignored.");
        } else if (tier == 2) {
            ValidateRequirement(h["requirement"], hId, evidenceIds, 0, result);
        }
    }

    // F) Contradictions
    const auto& contradictions = ArrayOrEmpty(caseJson, "contradictions");
    CollectIds(contradictions, "contradiction", errors);
    for (const auto& c : contradictions) {
        if (!c.is_object()) continue;
        for (const char* key : {"evidence_a", "evidence_b"}) {
            const std::string id = StringOr(c, key, "");
            if (!Contains(evidenceIds, id)) {
                errors.push_back("Contradiction '" + StringOr(c, "id", "?") + "' references unknown evidence '" +
                                 id + "'.");
            }
        }
    }

    // G) Solution
    if (!caseJson.contains("solution") || !caseJson["solution"].is_object()) {
        errors.push_back("Case has no solution.");
        return result;
    }
    const auto& solution = caseJson["solution"];
    const std::string culprit = StringOr(solution, "culprit", "");
    if (culprit.empty()) {
        errors.push_back("Solution has no culprit.");
    } else if (!Contains(witnessIds, culprit)) {
        errors.push_back("Culprit '" + culprit + "' is not a witness.");
    }
    CheckStringList(solution, "key_evidence", evidenceIds, "Solution key_evidence", errors);

    for (const auto& pair : ArrayOrEmpty(solution, "correlation_pairs")) {
        const std::string suspect = StringOr(pair, "suspect", "");
        if (!Contains(witnessIds, suspect)) {
            errors.push_back("Correlation pair references unknown suspect '" + suspect + "'.");
        }
        CheckStringList(pair, "presence_evidence", evidenceIds, "Correlation pair for '" + suspect + "'", errors);
        CheckStringList(pair, "distinguishing_evidence", evidenceIds, "Correlation pair for '" + suspect + "'",
                        errors);
    }

    if (solution.contains("common_mistakes") && !solution["common_mistakes"].is_object()) {
        errors.push_back("Solution common_mistakes must map suspect ids to {reason, why_wrong}.");
    }
    if (solution.contains("fallacy_examples") && solution["fallacy_examples"].is_object()) {
        for (const auto& item : solution["fallacy_examples"].items()) {
            if (!domain::FallacyFromString(item.key())) {
                warnings.push_back("Unknown fallacy kind '" + item.key() + "' in fallacy_examples.");
            }
        }
    }

    return result;
}

} // namespace casefile::infrastructure
