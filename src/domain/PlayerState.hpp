/**
 * @file PlayerState.hpp
 * @brief Per-session investigation progress.
 */

#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "UnlockEvent.hpp"
#include "Verdict.hpp"

namespace casefile::domain {

/**
 * @class PlayerState
 * @brief Value type threaded through every engine call.
 *
 * Invariants enforced by the commands below:
 * - discovered evidence, visited locations, unlocked hypotheses, revealed secrets and
 *   discovered contradictions only grow and hold no duplicates;
 * - the unlock event log is append-only and each hypothesis appears in it once;
 * - investigation points spent never decrease;
 * - attempts remaining never increase and never go below zero.
 */
class PlayerState {
public:
    PlayerState() = default;

    PlayerState(std::string caseId, std::string startLocation, int maxAttempts, int investigationBudget)
        : m_caseId(std::move(caseId)),
          m_currentLocation(std::move(startLocation)),
          m_maxAttempts(std::max(0, maxAttempts)),
          m_attemptsRemaining(std::max(0, maxAttempts)),
          m_investigationBudget(std::max(0, investigationBudget)) {
        if (!m_currentLocation.empty()) {
            m_visitedLocations.push_back(m_currentLocation);
        }
    }

    // --- Accessors ---
    const std::string& caseId() const { return m_caseId; }
    const std::string& currentLocation() const { return m_currentLocation; }
    const std::vector<std::string>& visitedLocations() const { return m_visitedLocations; }
    const std::vector<std::string>& discoveredEvidenceIds() const { return m_discoveredEvidence; }
    const std::vector<std::string>& unlockedHypothesisIds() const { return m_unlockedHypotheses; }
    const std::vector<UnlockEvent>& unlockEvents() const { return m_unlockEvents; }
    const std::vector<std::string>& pendingNotificationIds() const { return m_pendingNotifications; }
    const std::vector<VerdictAttempt>& verdictAttempts() const { return m_verdictAttempts; }
    const std::vector<std::string>& discoveredContradictionIds() const { return m_discoveredContradictions; }
    const std::map<std::string, int>& witnessTrust() const { return m_witnessTrust; }
    int attemptsRemaining() const { return m_attemptsRemaining; }
    int maxAttempts() const { return m_maxAttempts; }
    int investigationPointsSpent() const { return m_pointsSpent; }
    int investigationBudget() const { return m_investigationBudget; }
    CaseStatus caseStatus() const { return m_caseStatus; }

    bool hasDiscovered(const std::string& evidenceId) const {
        return Contains(m_discoveredEvidence, evidenceId);
    }

    bool isUnlocked(const std::string& hypothesisId) const {
        return Contains(m_unlockedHypotheses, hypothesisId);
    }

    bool isPending(const std::string& eventId) const {
        return Contains(m_pendingNotifications, eventId);
    }

    /** @brief Most recently discovered evidence id, empty if none. */
    std::string lastDiscoveredEvidenceId() const {
        return m_discoveredEvidence.empty() ? std::string() : m_discoveredEvidence.back();
    }

    // --- Commands ---

    void moveTo(const std::string& locationId) {
        m_currentLocation = locationId;
        if (!Contains(m_visitedLocations, locationId)) {
            m_visitedLocations.push_back(locationId);
        }
    }

    /** @return true if the id was newly added. */
    bool addEvidence(const std::string& evidenceId) {
        if (evidenceId.empty() || hasDiscovered(evidenceId)) return false;
        m_discoveredEvidence.push_back(evidenceId);
        return true;
    }

    /** @brief Adds points to the spent counter, never past the case budget. */
    void spendInvestigationPoints(int points) {
        if (points <= 0) return;
        m_pointsSpent = std::min(m_investigationBudget, m_pointsSpent + points);
    }

    /**
     * @brief Appends an unlock event, marks its hypothesis unlocked and queues the notification.
     * @return false (and no change) if the hypothesis was already unlocked.
     */
    bool recordUnlock(const UnlockEvent& event) {
        if (isUnlocked(event.hypothesisId)) return false;
        m_unlockEvents.push_back(event);
        m_unlockedHypotheses.push_back(event.hypothesisId);
        if (!event.acknowledged) {
            m_pendingNotifications.push_back(event.id);
        }
        return true;
    }

    /**
     * @brief Moves a pending notification to acknowledged.
     * @return false for unknown or already acknowledged ids.
     */
    bool acknowledge(const std::string& eventId) {
        auto it = std::find(m_pendingNotifications.begin(), m_pendingNotifications.end(), eventId);
        if (it == m_pendingNotifications.end()) return false;
        m_pendingNotifications.erase(it);
        for (auto& evt : m_unlockEvents) {
            if (evt.id == eventId) {
                evt.acknowledged = true;
                break;
            }
        }
        return true;
    }

    /** @brief Appends the attempt and consumes one attempt, floor 0. */
    void recordVerdictAttempt(const VerdictAttempt& attempt) {
        m_verdictAttempts.push_back(attempt);
        if (m_attemptsRemaining > 0) --m_attemptsRemaining;
    }

    void setCaseStatus(CaseStatus status) { m_caseStatus = status; }

    bool addContradiction(const std::string& contradictionId) {
        if (Contains(m_discoveredContradictions, contradictionId)) return false;
        m_discoveredContradictions.push_back(contradictionId);
        return true;
    }

    /** @brief Adjusts a witness trust counter, clamped to 0-100. */
    void adjustTrust(const std::string& witnessId, int delta, int baseTrust = 50) {
        auto it = m_witnessTrust.find(witnessId);
        int current = (it == m_witnessTrust.end()) ? baseTrust : it->second;
        m_witnessTrust[witnessId] = std::max(0, std::min(100, current + delta));
    }

    /** @brief Trust counter, or the witness's base trust before any adjustment. */
    int trustFor(const std::string& witnessId, int baseTrust) const {
        auto it = m_witnessTrust.find(witnessId);
        return (it == m_witnessTrust.end()) ? baseTrust : it->second;
    }

    const std::map<std::string, std::vector<std::string>>& revealedSecrets() const { return m_revealedSecrets; }

    bool hasRevealedSecret(const std::string& witnessId, const std::string& secretId) const {
        auto it = m_revealedSecrets.find(witnessId);
        return it != m_revealedSecrets.end() && Contains(it->second, secretId);
    }

    /** @return false (and no change) if the secret was already revealed. */
    bool revealSecret(const std::string& witnessId, const std::string& secretId) {
        if (secretId.empty() || hasRevealedSecret(witnessId, secretId)) return false;
        m_revealedSecrets[witnessId].push_back(secretId);
        return true;
    }

private:
    static bool Contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

    std::string m_caseId;
    std::string m_currentLocation;
    std::vector<std::string> m_visitedLocations;
    std::vector<std::string> m_discoveredEvidence;
    std::vector<std::string> m_unlockedHypotheses;
    std::vector<UnlockEvent> m_unlockEvents;
    std::vector<std::string> m_pendingNotifications;
    std::vector<VerdictAttempt> m_verdictAttempts;
    std::vector<std::string> m_discoveredContradictions;
    std::map<std::string, int> m_witnessTrust;
    std::map<std::string, std::vector<std::string>> m_revealedSecrets;

    int m_maxAttempts = 10;
    int m_attemptsRemaining = 10;
    int m_investigationBudget = 12;
    int m_pointsSpent = 0;
    CaseStatus m_caseStatus = CaseStatus::Active;
};

} // namespace casefile::domain
