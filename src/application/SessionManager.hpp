/**
 * @file SessionManager.hpp
 * @brief Owns live player sessions and serialises requests per session.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "application/InvestigationService.hpp"
#include "domain/CaseRepository.hpp"
#include "infrastructure/SnapshotStore.hpp"

namespace casefile::application {

/**
 * @class SessionManager
 * @brief One PlayerState per (caseId, playerId), each behind its own mutex.
 *
 * The registry lock is held only to look up or insert a session. Requests
 * for different keys never wait on each other; requests for the same key
 * run one at a time.
 */
class SessionManager {
public:
    /**
     * @param cases Case source shared by every session.
     * @param store Snapshot store; null disables save/restore.
     * @param maxAttempts Attempts granted to a new game.
     */
    SessionManager(std::shared_ptr<domain::CaseRepository> cases,
                   std::shared_ptr<infrastructure::SnapshotStore> store,
                   int maxAttempts,
                   InvestigationService::Clock clock = {});

    /**
     * @brief Opens (or returns) the session, restoring a saved snapshot when one exists.
     * @throws domain::ValidationError if the case cannot be loaded.
     * @throws domain::PersistenceError if a saved snapshot is corrupt.
     */
    StateSnapshot openSession(const std::string& caseId, const std::string& playerId);

    /** @brief Drops the in-memory session. Saved snapshots are left alone. */
    void closeSession(const std::string& caseId, const std::string& playerId);

    bool hasSession(const std::string& caseId, const std::string& playerId) const;

    ActionOutcome submitPlayerAction(const std::string& caseId, const std::string& playerId, const std::string& text);
    ActionOutcome moveTo(const std::string& caseId, const std::string& playerId, const std::string& locationId);
    domain::rules::UnlockScan spendInvestigationPoints(const std::string& caseId, const std::string& playerId, int points);
    void acknowledgeNotification(const std::string& caseId, const std::string& playerId, const std::string& eventId);
    domain::rules::VerdictOutcome submitVerdict(const std::string& caseId,
                                                const std::string& playerId,
                                                const domain::Accusation& accusation);
    StateSnapshot querySnapshot(const std::string& caseId, const std::string& playerId);
    InterrogationOutcome questionWitness(const std::string& caseId,
                                         const std::string& playerId,
                                         const std::string& witnessId,
                                         const std::string& question);
    InterrogationOutcome presentEvidence(const std::string& caseId,
                                         const std::string& playerId,
                                         const std::string& witnessId,
                                         const std::string& evidenceId);

    /** @brief Copy of the current state, for presentation and tests. */
    domain::PlayerState currentState(const std::string& caseId, const std::string& playerId);

    std::shared_ptr<const domain::CaseDefinition> caseDefinition(const std::string& caseId, const std::string& playerId);

    /**
     * @brief Persists the session's current state.
     *
     * The write is queued while the session lock is held, so saves for one
     * key land in request order.
     * @throws domain::PersistenceError; the in-memory state is unchanged.
     */
    void save(const std::string& caseId,
              const std::string& playerId,
              const std::string& slot = infrastructure::SnapshotStore::kDefaultSlot);

    /**
     * @brief Replaces the session state with the one saved in @p slot.
     * @return nullopt (state untouched) when the slot is empty.
     * @throws domain::PersistenceError on corrupt data, an unknown slot or no store.
     */
    std::optional<StateSnapshot> loadSlot(const std::string& caseId,
                                          const std::string& playerId,
                                          const std::string& slot);

    /** @throws domain::PersistenceError */
    bool deleteSave(const std::string& caseId, const std::string& playerId, const std::string& slot);

    /** @throws domain::PersistenceError without a store. */
    std::vector<infrastructure::SaveSlotInfo> listSaves(const std::string& caseId, const std::string& playerId);

    /** @brief Replaces the session state with a fresh game. */
    void reset(const std::string& caseId, const std::string& playerId);

private:
    struct Session {
        std::mutex mutex;
        std::shared_ptr<const domain::CaseDefinition> caseDef;
        domain::PlayerState state;
    };

    using Key = std::pair<std::string, std::string>;

    infrastructure::SnapshotStore& requireStore() const;

    std::shared_ptr<Session> acquire(const std::string& caseId, const std::string& playerId);

    std::shared_ptr<domain::CaseRepository> m_cases;
    std::shared_ptr<infrastructure::SnapshotStore> m_store;
    int m_maxAttempts;
    InvestigationService m_engine;

    mutable std::mutex m_registryMutex;
    std::map<Key, std::shared_ptr<Session>> m_sessions;
};

} // namespace casefile::application
