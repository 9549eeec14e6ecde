/**
 * @file CaseJsonParser.cpp
 * @brief Implementation of CaseJsonParser.
 */

#include "infrastructure/CaseJsonParser.hpp"
#include "domain/rules/WitnessRules.hpp"

#include <iostream>

namespace casefile::infrastructure {

using json = nlohmann::json;
using namespace casefile::domain;

namespace {

std::vector<std::string> StringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::vector<Requirement> ParseChildren(const json& req) {
    std::vector<Requirement> children;
    if (!req.contains("requirements") || !req["requirements"].is_array()) return children;
    for (const auto& child : req["requirements"]) {
        children.push_back(CaseJsonParser::ParseRequirement(child));
    }
    return children;
}

Evidence ParseEvidence(const json& j, const std::string& locationId) {
    Evidence e;
    e.id = j.value("id", "");
    e.locationId = locationId;
    e.name = j.value("name", e.id);
    e.description = j.value("description", "");
    e.triggers = StringList(j, "triggers");
    e.cost = j.value("cost", 0);
    e.significance = j.value("significance", "");
    if (j.contains("strength") && j["strength"].is_number_integer()) {
        e.strength = j["strength"].get<int>();
    }
    e.implicates = StringList(j, "implicates");
    e.exonerates = StringList(j, "exonerates");
    if (j.contains("implies_sequence") && j["implies_sequence"].is_array()) {
        for (const auto& claim : j["implies_sequence"]) {
            e.impliesSequence.push_back({claim.value("earlier", ""), claim.value("later", "")});
        }
    }
    return e;
}

Solution ParseSolution(const json& j) {
    Solution s;
    s.culprit = j.value("culprit", "");
    s.method = j.value("method", "");
    s.motive = j.value("motive", "");
    s.keyEvidence = StringList(j, "key_evidence");
    s.deductions = StringList(j, "deductions");
    s.counterArgumentKeywords = StringList(j, "counter_argument_keywords");

    if (j.contains("common_mistakes") && j["common_mistakes"].is_object()) {
        for (const auto& item : j["common_mistakes"].items()) {
            const auto& m = item.value();
            s.commonMistakes[item.key()] = CommonMistake{m.value("reason", ""), m.value("why_wrong", "")};
        }
    }
    if (j.contains("fallacy_examples") && j["fallacy_examples"].is_object()) {
        for (const auto& item : j["fallacy_examples"].items()) {
            if (item.value().is_string()) {
                s.fallacyExamples[item.key()] = item.value().get<std::string>();
            }
        }
    }
    if (j.contains("correlation_pairs") && j["correlation_pairs"].is_array()) {
        for (const auto& p : j["correlation_pairs"]) {
            s.correlationPairs.push_back({p.value("suspect", ""),
                                          StringList(p, "presence_evidence"),
                                          StringList(p, "distinguishing_evidence")});
        }
    }
    return s;
}

} // namespace

Requirement CaseJsonParser::ParseRequirement(const json& req) {
    const std::string type = req.value("type", "");
    if (type == "evidence_collected") {
        const std::string id = req.contains("evidence_id") ? req.value("evidence_id", "")
                                                           : req.value("evidenceId", "");
        return Requirement::Evidence(id);
    }
    if (type == "threshold_met") {
        ThresholdMet leaf;
        leaf.rawMetricName = req.value("metric", "");
        leaf.metric = MetricFromString(leaf.rawMetricName);
        leaf.threshold = req.value("threshold", 0);
        return Requirement{leaf};
    }
    if (type == "all_of") {
        return Requirement::All(ParseChildren(req));
    }
    if (type == "any_of") {
        return Requirement::Any(ParseChildren(req));
    }

    // Unreachable for validated documents. An empty any_of never holds.
    std::cerr << "[CaseJsonParser] Unknown requirement type '" << type << "'; treated as unmet." << std::endl;
    return Requirement::Any({});
}

CaseDefinition CaseJsonParser::Parse(const json& caseJson, int defaultInvestigationPoints) {
    CaseDefinition def;
    def.id = caseJson.value("id", "");
    def.title = caseJson.value("title", "");
    def.difficulty = caseJson.value("difficulty", "beginner");
    def.investigationPoints = caseJson.value("investigation_points", defaultInvestigationPoints);

    if (caseJson.contains("locations") && caseJson["locations"].is_array()) {
        for (const auto& lj : caseJson["locations"]) {
            Location loc;
            loc.id = lj.value("id", "");
            loc.name = lj.value("name", loc.id);
            loc.description = lj.value("description", "");
            if (lj.contains("not_present") && lj["not_present"].is_array()) {
                for (const auto& np : lj["not_present"]) {
                    loc.notPresent.push_back({np.value("id", ""), StringList(np, "triggers"),
                                              np.value("response", "")});
                }
            }
            if (lj.contains("evidence") && lj["evidence"].is_array()) {
                for (const auto& ej : lj["evidence"]) {
                    def.evidence.push_back(ParseEvidence(ej, loc.id));
                }
            }
            def.locations.push_back(std::move(loc));
        }
    }
    def.startLocation = caseJson.value("start_location",
                                       def.locations.empty() ? std::string() : def.locations.front().id);

    if (caseJson.contains("witnesses") && caseJson["witnesses"].is_array()) {
        for (const auto& wj : caseJson["witnesses"]) {
            Witness w;
            w.id = wj.value("id", "");
            w.name = wj.value("name", w.id);
            w.baseTrust = wj.value("base_trust", 50);
            w.wants = wj.value("wants", "");
            w.fears = wj.value("fears", "");
            w.authority = wj.value("authority", false);
            if (wj.contains("secrets") && wj["secrets"].is_array()) {
                for (const auto& sj : wj["secrets"]) {
                    WitnessSecret secret;
                    secret.id = sj.value("id", "");
                    secret.text = sj.value("text", "");
                    secret.triggerText = sj.value("trigger", "");
                    secret.trigger = rules::WitnessRules::parseTrigger(secret.triggerText);
                    w.secrets.push_back(std::move(secret));
                }
            }
            if (wj.contains("lies") && wj["lies"].is_array()) {
                for (const auto& lj : wj["lies"]) {
                    auto condition = rules::WitnessRules::parseTrustCondition(lj.value("condition", ""));
                    if (!condition) {
                        std::cerr << "[CaseJsonParser] Witness '" << w.id << "' lie without a trust condition skipped." << std::endl;
                        continue;
                    }
                    WitnessLie lie;
                    lie.comparison = condition->comparison;
                    lie.trustThreshold = condition->value;
                    lie.topics = StringList(lj, "topics");
                    lie.response = lj.value("response", "");
                    w.lies.push_back(std::move(lie));
                }
            }
            def.witnesses.push_back(std::move(w));
        }
    }

    if (caseJson.contains("hypotheses") && caseJson["hypotheses"].is_array()) {
        for (const auto& hj : caseJson["hypotheses"]) {
            Hypothesis h;
            h.id = hj.value("id", "");
            h.label = hj.value("label", h.id);
            h.description = hj.value("description", "");
            h.tier = hj.value("tier", 1);
            if (h.tier == 2 && hj.contains("requirement") && !hj["requirement"].is_null()) {
                h.requirement = ParseRequirement(hj["requirement"]);
            }
            def.hypotheses.push_back(std::move(h));
        }
    }

    if (caseJson.contains("contradictions") && caseJson["contradictions"].is_array()) {
        for (const auto& cj : caseJson["contradictions"]) {
            def.contradictions.push_back({cj.value("id", ""), cj.value("evidence_a", ""),
                                          cj.value("evidence_b", ""), cj.value("description", "")});
        }
    }

    if (caseJson.contains("timeline") && caseJson["timeline"].is_array()) {
        for (const auto& tj : caseJson["timeline"]) {
            def.timeline.push_back({tj.value("id", ""), tj.value("time", ""), tj.value("event", "")});
        }
    }

    if (caseJson.contains("solution") && caseJson["solution"].is_object()) {
        def.solution = ParseSolution(caseJson["solution"]);
    }

    return def;
}

} // namespace casefile::infrastructure
