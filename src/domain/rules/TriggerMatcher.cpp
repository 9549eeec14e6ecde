/**
 * @file TriggerMatcher.cpp
 * @brief Implementation of TriggerMatcher.
 */

#include "domain/rules/TriggerMatcher.hpp"
#include "domain/rules/TextMatching.hpp"

#include <iostream>

namespace casefile::domain::rules {

namespace {

bool HasUsableTrigger(const Evidence& evidence) {
    for (const auto& trigger : evidence.triggers) {
        if (!Trim(trigger).empty()) return true;
    }
    return false;
}

} // namespace

bool TriggerMatcher::matchesTrigger(const std::string& loweredInput, const std::vector<std::string>& triggers) {
    for (const auto& trigger : triggers) {
        const std::string needle = ToLower(Trim(trigger));
        if (needle.empty()) continue;
        if (loweredInput.find(needle) != std::string::npos) return true;
    }
    return false;
}

MatchResult TriggerMatcher::matchAction(const CaseDefinition& caseDef,
                                        const PlayerState& state,
                                        const std::string& inputText) {
    MatchResult result;
    const Location* location = caseDef.findLocation(state.currentLocation());
    if (!location) {
        std::cerr << "[TriggerMatcher] Unknown location '" << state.currentLocation()
                  << "' in case '" << caseDef.id << "'. Nothing can be discovered." << std::endl;
        return result;
    }

    const std::string input = ToLower(inputText);
    const auto candidates = caseDef.evidenceInLocation(location->id);

    // 1. Fresh discoveries
    for (const Evidence* evidence : candidates) {
        if (state.hasDiscovered(evidence->id)) continue;
        if (!HasUsableTrigger(*evidence)) {
            std::cerr << "[TriggerMatcher] Evidence '" << evidence->id
                      << "' has no triggers; it can never be discovered." << std::endl;
            continue;
        }
        if (matchesTrigger(input, evidence->triggers)) {
            result.outcome = MatchOutcome::Discovered;
            result.evidenceId = evidence->id;
            return result;
        }
    }

    // 2. Repeats of something already found
    for (const Evidence* evidence : candidates) {
        if (!state.hasDiscovered(evidence->id)) continue;
        if (matchesTrigger(input, evidence->triggers)) {
            result.outcome = MatchOutcome::AlreadyExamined;
            result.evidenceId = evidence->id;
            return result;
        }
    }

    // 3. Deliberately absent things
    for (const auto& entry : location->notPresent) {
        if (matchesTrigger(input, entry.triggers)) {
            result.outcome = MatchOutcome::NotPresent;
            result.responseId = entry.id;
            result.response = entry.response.empty()
                ? "You search but find nothing of note."
                : entry.response;
            return result;
        }
    }

    return result;
}

PlayerState TriggerMatcher::applyMatch(const CaseDefinition& caseDef,
                                       PlayerState state,
                                       const MatchResult& result) {
    if (result.outcome != MatchOutcome::Discovered) return state;

    const Evidence* evidence = caseDef.findEvidence(result.evidenceId);
    if (!evidence) {
        std::cerr << "[TriggerMatcher] Unknown evidence '" << result.evidenceId
                  << "'. Discovery ignored." << std::endl;
        return state;
    }

    if (state.addEvidence(evidence->id)) {
        state.spendInvestigationPoints(evidence->cost);
    }
    return state;
}

} // namespace casefile::domain::rules
