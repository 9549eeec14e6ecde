/**
 * @file SnapshotStore.cpp
 * @brief Implementation of SnapshotStore.
 */

#include "infrastructure/SnapshotStore.hpp"
#include "infrastructure/SnapshotCodec.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace casefile::infrastructure {

namespace fs = std::filesystem;
using domain::PersistenceError;
using domain::PlayerState;

namespace {

// Ids become file names: anything outside [A-Za-z0-9_-] is written as %XX.
std::string EncodeComponent(const std::string& id) {
    if (id.empty()) {
        throw PersistenceError("Empty id cannot name a save file.");
    }
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : id) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace

SnapshotStore::SnapshotStore(std::string savesDir, std::shared_ptr<PersistenceService> persistence)
    : m_savesDir(std::move(savesDir)), m_persistence(std::move(persistence)) {}

const std::vector<std::string>& SnapshotStore::namedSlots() {
    static const std::vector<std::string> slots = {"slot_1", "slot_2", "slot_3", kAutosaveSlot};
    return slots;
}

bool SnapshotStore::isValidSlot(const std::string& slot) {
    const auto& slots = namedSlots();
    return slot == kDefaultSlot || std::find(slots.begin(), slots.end(), slot) != slots.end();
}

std::string SnapshotStore::snapshotPath(const std::string& caseId,
                                        const std::string& playerId,
                                        const std::string& slot) const {
    if (!isValidSlot(slot)) {
        throw PersistenceError("Unknown save slot '" + slot + "'.");
    }
    // '.' is always encoded inside ids, so the slot suffix cannot be forged by a player id.
    std::string file = EncodeComponent(playerId);
    if (slot != kDefaultSlot) file += "." + slot;
    return (fs::path(m_savesDir) / EncodeComponent(caseId) / (file + ".json")).string();
}

std::future<void> SnapshotStore::saveAsync(const std::string& playerId,
                                           const PlayerState& state,
                                           const std::string& slot) {
    return m_persistence->saveTextAsync(snapshotPath(state.caseId(), playerId, slot),
                                        SnapshotCodec::EncodeToString(state));
}

void SnapshotStore::save(const std::string& playerId, const PlayerState& state, const std::string& slot) {
    saveAsync(playerId, state, slot).get();
    std::cout << "[SnapshotStore] Saved " << state.caseId() << "/" << playerId << " (" << slot << ")" << std::endl;
}

std::optional<PlayerState> SnapshotStore::load(const std::string& caseId,
                                               const std::string& playerId,
                                               const std::string& slot) const {
    const std::string path = snapshotPath(caseId, playerId, slot);
    auto text = m_persistence->readText(path);
    if (!text) return std::nullopt;

    PlayerState state = SnapshotCodec::DecodeFromString(*text);
    if (state.caseId() != caseId) {
        throw PersistenceError("Snapshot " + path + " belongs to case '" + state.caseId() + "'.");
    }
    return state;
}

bool SnapshotStore::remove(const std::string& caseId, const std::string& playerId, const std::string& slot) {
    const std::string path = snapshotPath(caseId, playerId, slot);
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        throw PersistenceError("Failed to delete " + path + ": " + ec.message());
    }
    if (removed) {
        std::cout << "[SnapshotStore] Deleted " << caseId << "/" << playerId << " (" << slot << ")" << std::endl;
    }
    return removed;
}

std::vector<SaveSlotInfo> SnapshotStore::listSlots(const std::string& caseId, const std::string& playerId) const {
    std::vector<SaveSlotInfo> infos;
    for (const auto& slot : namedSlots()) {
        try {
            auto state = load(caseId, playerId, slot);
            if (!state) continue;
            SaveSlotInfo info;
            info.slot = slot;
            info.currentLocation = state->currentLocation();
            info.evidenceCount = static_cast<int>(state->discoveredEvidenceIds().size());
            info.attemptsRemaining = state->attemptsRemaining();
            info.investigationPointsSpent = state->investigationPointsSpent();
            info.caseStatus = state->caseStatus();
            infos.push_back(info);
        } catch (const PersistenceError& e) {
            std::cerr << "[SnapshotStore] Skipping slot " << slot << ": " << e.what() << std::endl;
        }
    }
    return infos;
}

} // namespace casefile::infrastructure
