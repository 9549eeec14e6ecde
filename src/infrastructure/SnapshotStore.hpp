/**
 * @file SnapshotStore.hpp
 * @brief File-system store for PlayerState snapshots.
 */

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/PlayerState.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace casefile::infrastructure {

/**
 * @struct SaveSlotInfo
 * @brief Summary of one saved slot for a save/load menu.
 */
struct SaveSlotInfo {
    std::string slot;
    std::string currentLocation;
    int evidenceCount = 0;
    int attemptsRemaining = 0;
    int investigationPointsSpent = 0;
    domain::CaseStatus caseStatus = domain::CaseStatus::Active;
};

/**
 * @class SnapshotStore
 * @brief JSON files per (case, player, slot) under `<savesDir>/<caseId>/`.
 *
 * The default slot lives at `<playerId>.json`, named slots at
 * `<playerId>.<slot>.json`. Ids are percent-encoded, so distinct ids never
 * share a file. Writes go through the shared PersistenceService, so a
 * snapshot is saved whole or not at all.
 */
class SnapshotStore {
public:
    static constexpr const char* kDefaultSlot = "default";
    static constexpr const char* kAutosaveSlot = "autosave";

    SnapshotStore(std::string savesDir, std::shared_ptr<PersistenceService> persistence);

    /** @brief slot_1, slot_2, slot_3 and autosave, in menu order. */
    static const std::vector<std::string>& namedSlots();

    static bool isValidSlot(const std::string& slot);

    /** @brief Queues a save. The future carries a PersistenceError on failure. */
    std::future<void> saveAsync(const std::string& playerId,
                                const domain::PlayerState& state,
                                const std::string& slot = kDefaultSlot);

    /** @brief Saves and waits. @throws domain::PersistenceError */
    void save(const std::string& playerId,
              const domain::PlayerState& state,
              const std::string& slot = kDefaultSlot);

    /**
     * @return nullopt when no save exists.
     * @throws domain::PersistenceError on unreadable or corrupt data, or an unknown slot.
     */
    std::optional<domain::PlayerState> load(const std::string& caseId,
                                            const std::string& playerId,
                                            const std::string& slot = kDefaultSlot) const;

    /** @return false if there was nothing to delete. @throws domain::PersistenceError */
    bool remove(const std::string& caseId, const std::string& playerId, const std::string& slot);

    /** @brief Named slots that hold a readable save. Corrupt slots are logged and skipped. */
    std::vector<SaveSlotInfo> listSlots(const std::string& caseId, const std::string& playerId) const;

    /** @throws domain::PersistenceError for an empty id or an unknown slot. */
    std::string snapshotPath(const std::string& caseId,
                             const std::string& playerId,
                             const std::string& slot = kDefaultSlot) const;

private:
    std::string m_savesDir;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace casefile::infrastructure
