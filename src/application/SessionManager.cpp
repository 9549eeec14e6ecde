/**
 * @file SessionManager.cpp
 * @brief Implementation of SessionManager.
 */

#include "application/SessionManager.hpp"
#include "domain/Errors.hpp"

#include <future>
#include <iostream>

namespace casefile::application {

using namespace casefile::domain;

SessionManager::SessionManager(std::shared_ptr<CaseRepository> cases,
                               std::shared_ptr<infrastructure::SnapshotStore> store,
                               int maxAttempts,
                               InvestigationService::Clock clock)
    : m_cases(std::move(cases)),
      m_store(std::move(store)),
      m_maxAttempts(maxAttempts),
      m_engine(std::move(clock)) {}

std::shared_ptr<SessionManager::Session> SessionManager::acquire(const std::string& caseId,
                                                                 const std::string& playerId) {
    const Key key{caseId, playerId};
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        auto it = m_sessions.find(key);
        if (it != m_sessions.end()) return it->second;
    }

    // Load outside the registry lock; file I/O must not stall other keys.
    auto session = std::make_shared<Session>();
    session->caseDef = m_cases->loadCase(caseId);

    std::optional<PlayerState> restored;
    if (m_store) {
        restored = m_store->load(caseId, playerId);
    }
    if (restored) {
        session->state = std::move(*restored);
        std::cout << "[SessionManager] Restored " << caseId << "/" << playerId << std::endl;
    } else {
        session->state = InvestigationService::newGame(*session->caseDef, m_maxAttempts);
        std::cout << "[SessionManager] New game " << caseId << "/" << playerId << std::endl;
    }

    std::lock_guard<std::mutex> lock(m_registryMutex);
    // Another request may have opened the same key meanwhile; keep the first.
    auto inserted = m_sessions.emplace(key, session);
    return inserted.first->second;
}

StateSnapshot SessionManager::openSession(const std::string& caseId, const std::string& playerId) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    return m_engine.querySnapshot(*session->caseDef, session->state);
}

void SessionManager::closeSession(const std::string& caseId, const std::string& playerId) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    m_sessions.erase(Key{caseId, playerId});
}

bool SessionManager::hasSession(const std::string& caseId, const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    return m_sessions.count(Key{caseId, playerId}) > 0;
}

ActionOutcome SessionManager::submitPlayerAction(const std::string& caseId,
                                                 const std::string& playerId,
                                                 const std::string& text) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto outcome = m_engine.submitPlayerAction(*session->caseDef, session->state, text);
    session->state = outcome.state;
    return outcome;
}

ActionOutcome SessionManager::moveTo(const std::string& caseId,
                                     const std::string& playerId,
                                     const std::string& locationId) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto outcome = m_engine.moveTo(*session->caseDef, session->state, locationId);
    session->state = outcome.state;
    return outcome;
}

rules::UnlockScan SessionManager::spendInvestigationPoints(const std::string& caseId,
                                                           const std::string& playerId,
                                                           int points) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto scan = m_engine.spendInvestigationPoints(*session->caseDef, session->state, points);
    session->state = scan.state;
    return scan;
}

void SessionManager::acknowledgeNotification(const std::string& caseId,
                                             const std::string& playerId,
                                             const std::string& eventId) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    session->state = m_engine.acknowledgeNotification(eventId, std::move(session->state));
}

rules::VerdictOutcome SessionManager::submitVerdict(const std::string& caseId,
                                                    const std::string& playerId,
                                                    const Accusation& accusation) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto outcome = m_engine.submitVerdict(accusation, *session->caseDef, session->state);
    session->state = outcome.state;
    return outcome;
}

StateSnapshot SessionManager::querySnapshot(const std::string& caseId, const std::string& playerId) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    return m_engine.querySnapshot(*session->caseDef, session->state);
}

PlayerState SessionManager::currentState(const std::string& caseId, const std::string& playerId) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    return session->state;
}

std::shared_ptr<const CaseDefinition> SessionManager::caseDefinition(const std::string& caseId,
                                                                     const std::string& playerId) {
    return acquire(caseId, playerId)->caseDef;
}

infrastructure::SnapshotStore& SessionManager::requireStore() const {
    if (!m_store) {
        throw PersistenceError("Saving is not configured for this session manager.");
    }
    return *m_store;
}

InterrogationOutcome SessionManager::questionWitness(const std::string& caseId,
                                                     const std::string& playerId,
                                                     const std::string& witnessId,
                                                     const std::string& question) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto outcome = m_engine.questionWitness(*session->caseDef, session->state, witnessId, question);
    session->state = outcome.state;
    return outcome;
}

InterrogationOutcome SessionManager::presentEvidence(const std::string& caseId,
                                                     const std::string& playerId,
                                                     const std::string& witnessId,
                                                     const std::string& evidenceId) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto outcome = m_engine.presentEvidence(*session->caseDef, session->state, witnessId, evidenceId);
    session->state = outcome.state;
    return outcome;
}

void SessionManager::save(const std::string& caseId, const std::string& playerId, const std::string& slot) {
    auto& store = requireStore();
    auto session = acquire(caseId, playerId);
    std::future<void> pending;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        pending = store.saveAsync(playerId, session->state, slot);
    }
    pending.get();
    std::cout << "[SessionManager] Saved " << caseId << "/" << playerId << " to " << slot << std::endl;
}

std::optional<StateSnapshot> SessionManager::loadSlot(const std::string& caseId,
                                                      const std::string& playerId,
                                                      const std::string& slot) {
    auto& store = requireStore();
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto restored = store.load(caseId, playerId, slot);
    if (!restored) return std::nullopt;
    session->state = std::move(*restored);
    std::cout << "[SessionManager] Loaded " << caseId << "/" << playerId << " from " << slot << std::endl;
    return m_engine.querySnapshot(*session->caseDef, session->state);
}

bool SessionManager::deleteSave(const std::string& caseId, const std::string& playerId, const std::string& slot) {
    return requireStore().remove(caseId, playerId, slot);
}

std::vector<infrastructure::SaveSlotInfo> SessionManager::listSaves(const std::string& caseId,
                                                                    const std::string& playerId) {
    return requireStore().listSlots(caseId, playerId);
}

void SessionManager::reset(const std::string& caseId, const std::string& playerId) {
    auto session = acquire(caseId, playerId);
    std::lock_guard<std::mutex> lock(session->mutex);
    session->state = InvestigationService::newGame(*session->caseDef, m_maxAttempts);
    std::cout << "[SessionManager] Reset " << caseId << "/" << playerId << std::endl;
}

} // namespace casefile::application
