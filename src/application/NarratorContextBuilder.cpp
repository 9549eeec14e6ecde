/**
 * @file NarratorContextBuilder.cpp
 * @brief Implementation of the NarratorContextBuilder.
 */

#include "application/NarratorContextBuilder.hpp"
#include "domain/rules/ContradictionTracker.hpp"

namespace casefile::application {

using json = nlohmann::json;
using namespace casefile::domain;

json NarratorContextBuilder::buildInvestigationBlock(const CaseDefinition& caseDef, const PlayerState& state) {
    json evidence = json::array();
    for (const auto& id : state.discoveredEvidenceIds()) {
        const Evidence* e = caseDef.findEvidence(id);
        evidence.push_back({{"id", id}, {"name", e ? e->name : id}});
    }

    json trust = json::object();
    for (const auto& w : caseDef.witnesses) {
        auto it = state.witnessTrust().find(w.id);
        trust[w.id] = (it == state.witnessTrust().end()) ? w.baseTrust : it->second;
    }

    return {
        {"case_title", caseDef.title},
        {"discovered_evidence", evidence},
        {"witness_trust", trust},
        {"investigation_points_spent", state.investigationPointsSpent()},
        {"investigation_budget", state.investigationBudget()},
        {"contradiction_discovery_rate", rules::ContradictionTracker::discoveryRate(caseDef.contradictions, state)}
    };
}

json NarratorContextBuilder::buildInterrogationContext(const CaseDefinition& caseDef,
                                                       const std::string& question,
                                                       const InterrogationOutcome& outcome) {
    json ctx;
    ctx["question"] = question;
    if (const Witness* w = caseDef.findWitness(outcome.witnessId)) {
        ctx["witness"] = {{"id", w->id}, {"name", w->name}, {"wants", w->wants}, {"fears", w->fears}};
    }
    ctx["trust"] = outcome.trust;
    ctx["trust_delta"] = outcome.trustDelta;

    if (!outcome.presentedEvidenceId.empty()) {
        if (const Evidence* e = caseDef.findEvidence(outcome.presentedEvidenceId)) {
            ctx["presented_evidence"] = {{"id", e->id}, {"name", e->name}, {"description", e->description}};
        }
    }
    if (outcome.lie) {
        ctx["lie_response"] = outcome.lie->response;
    }

    json secrets = json::array();
    if (const Witness* w = caseDef.findWitness(outcome.witnessId)) {
        for (const auto& id : outcome.revealedSecretIds) {
            if (const WitnessSecret* secret = w->findSecret(id)) secrets.push_back(secret->text);
        }
    }
    ctx["revealed_secrets"] = secrets;

    ctx["investigation"] = buildInvestigationBlock(caseDef, outcome.state);
    return ctx;
}

json NarratorContextBuilder::buildActionContext(const CaseDefinition& caseDef,
                                                const std::string& inputText,
                                                const ActionOutcome& outcome) {
    const PlayerState& state = outcome.state;
    json ctx;
    ctx["player_action"] = inputText;
    ctx["outcome"] = rules::OutcomeToString(outcome.match.outcome);

    if (const Location* loc = caseDef.findLocation(state.currentLocation())) {
        ctx["location"] = {{"id", loc->id}, {"name", loc->name}, {"description", loc->description}};
    }

    if (!outcome.match.evidenceId.empty()) {
        if (const Evidence* e = caseDef.findEvidence(outcome.match.evidenceId)) {
            ctx["evidence"] = {{"id", e->id}, {"name", e->name}, {"description", e->description}};
        }
    }
    if (!outcome.match.response.empty()) {
        ctx["response"] = outcome.match.response;
    }

    json unlocked = json::array();
    for (const auto& evt : outcome.unlocks) {
        const Hypothesis* h = caseDef.findHypothesis(evt.hypothesisId);
        unlocked.push_back(h ? h->label : evt.hypothesisId);
    }
    ctx["new_hypotheses"] = unlocked;

    json contradictions = json::array();
    for (const auto& id : outcome.newContradictionIds) {
        for (const auto& c : caseDef.contradictions) {
            if (c.id == id) contradictions.push_back(c.description);
        }
    }
    ctx["new_contradictions"] = contradictions;

    ctx["investigation"] = buildInvestigationBlock(caseDef, state);
    return ctx;
}

json NarratorContextBuilder::buildVerdictContext(const CaseDefinition& caseDef,
                                                 const PlayerState& state,
                                                 const Accusation& accusation,
                                                 const VerdictResult& result) {
    json fallacies = json::array();
    for (const auto& f : result.fallacies) {
        fallacies.push_back({{"name", FallacyToString(f.kind)}, {"example", f.example}});
    }

    json ctx = {
        {"accused", accusation.accusedId},
        {"reasoning", accusation.reasoning},
        {"cited_evidence", accusation.citedEvidenceIds},
        {"correct", result.correct},
        {"score", result.score},
        {"quality", result.quality},
        {"fallacies", fallacies},
        {"missing_key_evidence", result.missingEvidence},
        {"feedback", result.feedback},
        {"tone", ToneToString(result.tone)},
        {"hint", result.hint},
        {"attempts_remaining", result.attemptsRemaining},
        {"case_status", CaseStatusToString(result.caseStatus)},
        {"investigation", buildInvestigationBlock(caseDef, state)}
    };
    if (!result.whyWrong.empty()) ctx["why_wrong"] = result.whyWrong;
    if (result.revealedCulprit) ctx["revealed_culprit"] = *result.revealedCulprit;
    return ctx;
}

} // namespace casefile::application
