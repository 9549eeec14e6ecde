/**
 * @file TriggerMatcher.hpp
 * @brief Matches free-text player actions against evidence triggers.
 */

#pragma once

#include <string>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"

namespace casefile::domain::rules {

enum class MatchOutcome {
    Discovered,      ///< A new evidence entry was found.
    AlreadyExamined, ///< The input targets evidence the player already has.
    NotPresent,      ///< The input targets something the case marks as absent.
    NoDiscovery,     ///< Nothing matched.
    Moved            ///< The input was a navigation command (handled by the session layer).
};

inline std::string OutcomeToString(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::Discovered: return "discovered";
        case MatchOutcome::AlreadyExamined: return "already_examined";
        case MatchOutcome::NotPresent: return "not_present";
        case MatchOutcome::NoDiscovery: return "no_discovery";
        case MatchOutcome::Moved: return "moved";
    }
    return "no_discovery";
}

struct MatchResult {
    MatchOutcome outcome = MatchOutcome::NoDiscovery;
    std::string evidenceId;  ///< Discovered or AlreadyExamined.
    std::string responseId;  ///< NotPresent canned response id.
    std::string response;    ///< NotPresent canned response text.
    std::string locationId;  ///< Moved target.
};

/**
 * @class TriggerMatcher
 * @brief Decides what a player action discovers in the current location.
 *
 * Order of checks: undiscovered evidence, already discovered evidence,
 * not-present entries. The first structural match in definition order wins.
 */
class TriggerMatcher {
public:
    /** @brief Pure decision; the state is not modified. */
    static MatchResult matchAction(const CaseDefinition& caseDef,
                                   const PlayerState& state,
                                   const std::string& inputText);

    /**
     * @brief Applies a Discovered result: adds the evidence once and spends its cost.
     *
     * Any other outcome returns the state unchanged.
     */
    static PlayerState applyMatch(const CaseDefinition& caseDef,
                                  PlayerState state,
                                  const MatchResult& result);

    /** @brief Case-insensitive substring test; empty triggers never match. */
    static bool matchesTrigger(const std::string& loweredInput, const std::vector<std::string>& triggers);
};

} // namespace casefile::domain::rules
