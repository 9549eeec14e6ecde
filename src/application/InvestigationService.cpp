/**
 * @file InvestigationService.cpp
 * @brief Implementation of the InvestigationService.
 */

#include "application/InvestigationService.hpp"
#include "domain/rules/ContradictionTracker.hpp"
#include "domain/rules/LocationCommandParser.hpp"
#include "domain/rules/TextMatching.hpp"
#include "domain/rules/WitnessRules.hpp"

#include <algorithm>
#include <iostream>

namespace casefile::application {

using namespace casefile::domain;
using namespace casefile::domain::rules;

InvestigationService::InvestigationService(Clock clock) : m_clock(std::move(clock)) {}

std::chrono::system_clock::time_point InvestigationService::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

PlayerState InvestigationService::newGame(const CaseDefinition& caseDef, int maxAttempts) {
    return PlayerState(caseDef.id, caseDef.startLocation, maxAttempts, caseDef.investigationPoints);
}

ActionOutcome InvestigationService::submitPlayerAction(const CaseDefinition& caseDef,
                                                       PlayerState state,
                                                       const std::string& text) const {
    ActionOutcome outcome;
    outcome.match = TriggerMatcher::matchAction(caseDef, state, text);

    // Navigation only claims input that matched nothing here.
    if (outcome.match.outcome == MatchOutcome::NoDiscovery) {
        LocationCommandParser parser(caseDef.locations);
        auto target = parser.parse(text);
        if (target && *target != state.currentLocation()) {
            return moveTo(caseDef, std::move(state), *target);
        }
    }

    state = TriggerMatcher::applyMatch(caseDef, std::move(state), outcome.match);

    // Discovery is fully applied before the scan sees the state.
    auto scan = UnlockEvaluator::scanUnlocks(caseDef, std::move(state), now());
    outcome.unlocks = std::move(scan.events);
    outcome.newContradictionIds = std::move(scan.newContradictionIds);
    outcome.state = std::move(scan.state);
    return outcome;
}

ActionOutcome InvestigationService::moveTo(const CaseDefinition& caseDef,
                                           PlayerState state,
                                           const std::string& locationId) const {
    ActionOutcome outcome;
    if (!caseDef.findLocation(locationId)) {
        std::cerr << "[InvestigationService] Unknown location '" << locationId << "'; staying put." << std::endl;
        outcome.state = std::move(state);
        return outcome;
    }
    state.moveTo(locationId);
    outcome.match.outcome = MatchOutcome::Moved;
    outcome.match.locationId = locationId;
    outcome.state = std::move(state);
    return outcome;
}

UnlockScan InvestigationService::scanUnlocks(const CaseDefinition& caseDef, PlayerState state) const {
    return UnlockEvaluator::scanUnlocks(caseDef, std::move(state), now());
}

PlayerState InvestigationService::acknowledgeNotification(const std::string& eventId, PlayerState state) const {
    return NotificationQueue::acknowledge(eventId, std::move(state));
}

VerdictOutcome InvestigationService::submitVerdict(const Accusation& accusation,
                                                   const CaseDefinition& caseDef,
                                                   PlayerState state) const {
    return VerdictEvaluator::submitVerdict(accusation, caseDef, std::move(state), now());
}

StateSnapshot InvestigationService::querySnapshot(const CaseDefinition& caseDef, const PlayerState& state) const {
    StateSnapshot snap;
    snap.currentLocation = state.currentLocation();
    snap.discoveredEvidenceIds = state.discoveredEvidenceIds();
    snap.unlockedHypothesisIds = state.unlockedHypothesisIds();
    for (const auto& h : caseDef.hypotheses) {
        if (h.tier == 1 || state.isUnlocked(h.id)) snap.availableHypothesisIds.push_back(h.id);
    }
    snap.pendingNotifications = NotificationQueue::pendingNotifications(caseDef, state);
    snap.discoveredContradictionIds = state.discoveredContradictionIds();
    snap.contradictionDiscoveryRate = ContradictionTracker::discoveryRate(caseDef.contradictions, state);
    snap.attemptsRemaining = state.attemptsRemaining();
    snap.investigationPointsSpent = state.investigationPointsSpent();
    snap.investigationPointsRemaining = std::max(0, state.investigationBudget() - state.investigationPointsSpent());
    snap.caseStatus = state.caseStatus();
    return snap;
}

UnlockScan InvestigationService::spendInvestigationPoints(const CaseDefinition& caseDef,
                                                          PlayerState state,
                                                          int points) const {
    state.spendInvestigationPoints(points);
    return UnlockEvaluator::scanUnlocks(caseDef, std::move(state), now());
}

UnlockScan InvestigationService::forceUnlock(const CaseDefinition& caseDef,
                                             PlayerState state,
                                             const std::string& hypothesisId) const {
    return UnlockEvaluator::forceUnlock(caseDef, std::move(state), hypothesisId, now());
}

PlayerState InvestigationService::adjustWitnessTrust(const CaseDefinition& caseDef,
                                                     PlayerState state,
                                                     const std::string& witnessId,
                                                     int delta) const {
    const Witness* witness = caseDef.findWitness(witnessId);
    if (!witness) {
        std::cerr << "[InvestigationService] Unknown witness '" << witnessId << "'; trust unchanged." << std::endl;
        return state;
    }
    state.adjustTrust(witnessId, delta, witness->baseTrust);
    return state;
}

namespace {

/** Collected clue named by id or by a word of its name. */
std::string ResolvePresentedEvidence(const CaseDefinition& caseDef, const PlayerState& state, const std::string& word) {
    for (const auto& id : state.discoveredEvidenceIds()) {
        if (ToLower(id) == word) return id;
    }
    for (const auto& id : state.discoveredEvidenceIds()) {
        const Evidence* evidence = caseDef.findEvidence(id);
        if (!evidence) continue;
        const std::string name = ToLower(evidence->name);
        size_t pos = name.find(word);
        while (pos != std::string::npos) {
            const bool startsWord = pos == 0 || name[pos - 1] == ' ';
            const size_t end = pos + word.size();
            const bool endsWord = end == name.size() || name[end] == ' ';
            if (startsWord && endsWord) return id;
            pos = name.find(word, pos + 1);
        }
    }
    return {};
}

std::vector<std::string> RevealAvailable(const Witness& witness, int trust, PlayerState& state) {
    std::vector<std::string> revealed;
    for (const WitnessSecret* secret : WitnessRules::availableSecrets(witness, trust, state)) {
        if (state.revealSecret(witness.id, secret->id)) revealed.push_back(secret->id);
    }
    return revealed;
}

} // namespace

InterrogationOutcome InvestigationService::questionWitness(const CaseDefinition& caseDef,
                                                           PlayerState state,
                                                           const std::string& witnessId,
                                                           const std::string& question) const {
    InterrogationOutcome outcome;
    outcome.witnessId = witnessId;
    const Witness* witness = caseDef.findWitness(witnessId);
    if (!witness) {
        std::cerr << "[InvestigationService] Unknown witness '" << witnessId << "'; nobody answers." << std::endl;
        outcome.state = std::move(state);
        return outcome;
    }

    if (auto word = WitnessRules::detectEvidencePresentation(question)) {
        const std::string evidenceId = ResolvePresentedEvidence(caseDef, state, *word);
        if (!evidenceId.empty()) {
            return presentEvidence(caseDef, std::move(state), witnessId, evidenceId);
        }
    }

    outcome.witnessKnown = true;
    outcome.trustDelta = WitnessRules::trustDelta(question);
    if (outcome.trustDelta != 0) {
        state.adjustTrust(witness->id, outcome.trustDelta, witness->baseTrust);
    }
    outcome.trust = WitnessRules::currentTrust(*witness, state);

    outcome.lie = WitnessRules::shouldLie(*witness, question, outcome.trust);
    if (!outcome.lie) {
        outcome.revealedSecretIds = RevealAvailable(*witness, outcome.trust, state);
    }
    outcome.state = std::move(state);
    return outcome;
}

InterrogationOutcome InvestigationService::presentEvidence(const CaseDefinition& caseDef,
                                                           PlayerState state,
                                                           const std::string& witnessId,
                                                           const std::string& evidenceId) const {
    InterrogationOutcome outcome;
    outcome.witnessId = witnessId;
    const Witness* witness = caseDef.findWitness(witnessId);
    if (!witness) {
        std::cerr << "[InvestigationService] Unknown witness '" << witnessId << "'; nobody answers." << std::endl;
        outcome.state = std::move(state);
        return outcome;
    }
    outcome.witnessKnown = true;
    if (!state.hasDiscovered(evidenceId)) {
        std::cerr << "[InvestigationService] Evidence '" << evidenceId << "' has not been found; nothing to show." << std::endl;
        outcome.trust = WitnessRules::currentTrust(*witness, state);
        outcome.state = std::move(state);
        return outcome;
    }

    outcome.presentedEvidenceId = evidenceId;
    outcome.revealedSecretIds = RevealAvailable(*witness, WitnessRules::currentTrust(*witness, state), state);

    const int before = WitnessRules::currentTrust(*witness, state);
    state.adjustTrust(witness->id, WitnessRules::kPresentationBonus, witness->baseTrust);
    outcome.trust = WitnessRules::currentTrust(*witness, state);
    outcome.trustDelta = outcome.trust - before;
    outcome.state = std::move(state);
    return outcome;
}

} // namespace casefile::application
