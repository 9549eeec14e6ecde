/**
 * @file InvestigationService.hpp
 * @brief Operation surface of the investigation engine for one case.
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"
#include "domain/rules/NotificationQueue.hpp"
#include "domain/rules/TriggerMatcher.hpp"
#include "domain/rules/UnlockEvaluator.hpp"
#include "domain/rules/VerdictEvaluator.hpp"

namespace casefile::application {

/**
 * @struct ActionOutcome
 * @brief What one player action did, with every state change applied.
 */
struct ActionOutcome {
    domain::rules::MatchResult match;
    std::vector<domain::UnlockEvent> unlocks;
    std::vector<std::string> newContradictionIds;
    domain::PlayerState state;
};

/**
 * @struct InterrogationOutcome
 * @brief One question or presentation put to a witness.
 *
 * A lie and revealed secrets never occur in the same outcome.
 */
struct InterrogationOutcome {
    std::string witnessId;
    bool witnessKnown = false;
    std::string presentedEvidenceId;   ///< Set when the input showed a collected clue.
    int trustDelta = 0;
    int trust = 0;                     ///< Trust after this turn.
    std::optional<domain::WitnessLie> lie;
    std::vector<std::string> revealedSecretIds;
    domain::PlayerState state;
};

/**
 * @struct StateSnapshot
 * @brief Read-only projection for presentation.
 */
struct StateSnapshot {
    std::string currentLocation;
    std::vector<std::string> discoveredEvidenceIds;
    std::vector<std::string> unlockedHypothesisIds;
    std::vector<std::string> availableHypothesisIds; ///< Tier 1 plus unlocked tier 2, in case order.
    std::vector<domain::rules::UnlockNotification> pendingNotifications;
    std::vector<std::string> discoveredContradictionIds;
    int contradictionDiscoveryRate = 100; ///< Percent of the case's contradictions found.
    int attemptsRemaining = 0;
    int investigationPointsSpent = 0;
    int investigationPointsRemaining = 0;
    domain::CaseStatus caseStatus = domain::CaseStatus::Active;
};

/**
 * @class InvestigationService
 * @brief Stateless orchestration over the rule engine.
 *
 * Every operation takes a state snapshot and returns the next one. Discovery
 * is always applied before the unlock scan of the same action.
 */
class InvestigationService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /** @param clock Time source for event timestamps; system_clock when empty. */
    explicit InvestigationService(Clock clock = {});

    /**
     * @brief Trigger matching, then the unlock scan.
     *
     * Input that matches nothing in the current location is tried as a
     * navigation command. A move to another location skips the scan.
     */
    ActionOutcome submitPlayerAction(const domain::CaseDefinition& caseDef,
                                     domain::PlayerState state,
                                     const std::string& text) const;

    domain::rules::UnlockScan scanUnlocks(const domain::CaseDefinition& caseDef,
                                          domain::PlayerState state) const;

    domain::PlayerState acknowledgeNotification(const std::string& eventId,
                                                domain::PlayerState state) const;

    domain::rules::VerdictOutcome submitVerdict(const domain::Accusation& accusation,
                                                const domain::CaseDefinition& caseDef,
                                                domain::PlayerState state) const;

    StateSnapshot querySnapshot(const domain::CaseDefinition& caseDef,
                                const domain::PlayerState& state) const;

    /** @brief Moves to a known location. Unknown ids leave the state unchanged. */
    ActionOutcome moveTo(const domain::CaseDefinition& caseDef,
                         domain::PlayerState state,
                         const std::string& locationId) const;

    /** @brief Spends points outside evidence discovery, then scans for unlocks. */
    domain::rules::UnlockScan spendInvestigationPoints(const domain::CaseDefinition& caseDef,
                                                       domain::PlayerState state,
                                                       int points) const;

    domain::rules::UnlockScan forceUnlock(const domain::CaseDefinition& caseDef,
                                          domain::PlayerState state,
                                          const std::string& hypothesisId) const;

    /** @brief Adjusts a witness trust counter; unknown witnesses are ignored. */
    domain::PlayerState adjustWitnessTrust(const domain::CaseDefinition& caseDef,
                                           domain::PlayerState state,
                                           const std::string& witnessId,
                                           int delta) const;

    /**
     * @brief Puts a question to a witness.
     *
     * Input such as "show the wand" that names a collected clue is handled as
     * presentEvidence. Otherwise the tone of the question moves trust. A
     * witness who lies this turn reveals nothing; else every secret whose
     * trigger now holds is revealed. Unknown witnesses leave the state unchanged.
     */
    InterrogationOutcome questionWitness(const domain::CaseDefinition& caseDef,
                                         domain::PlayerState state,
                                         const std::string& witnessId,
                                         const std::string& question) const;

    /**
     * @brief Shows a collected clue to a witness.
     *
     * Secrets are checked at the trust held before the presentation bonus.
     * Clues the player has not found are refused.
     */
    InterrogationOutcome presentEvidence(const domain::CaseDefinition& caseDef,
                                         domain::PlayerState state,
                                         const std::string& witnessId,
                                         const std::string& evidenceId) const;

    /** @brief Fresh state for a case: start location, full attempts, case budget. */
    static domain::PlayerState newGame(const domain::CaseDefinition& caseDef, int maxAttempts);

private:
    std::chrono::system_clock::time_point now() const;

    Clock m_clock;
};

} // namespace casefile::application
