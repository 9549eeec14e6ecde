#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <variant>

#include "application/InvestigationService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SnapshotCodec.hpp"
#include "infrastructure/SnapshotStore.hpp"
#include "TestFixtures.hpp"

using namespace casefile::application;
using namespace casefile::domain;
using namespace casefile::infrastructure;
using namespace casefile::test;

namespace {

PlayerState PlayThrough(const CaseDefinition& def) {
    InvestigationService service([] { return FixedTime(); });
    PlayerState state = InvestigationService::newGame(def, 10);
    state = service.submitPlayerAction(def, state, "read the letter").state;
    state = service.submitPlayerAction(def, state, "look up").state;
    state = service.spendInvestigationPoints(def, state, 2).state;
    state = service.submitPlayerAction(def, state, "go to the library").state;
    state = service.submitPlayerAction(def, state, "check the ledger").state;
    state = service.submitPlayerAction(def, state, "search the bookcase").state;
    state = service.questionWitness(def, state, "hannah", "Where were you at nine?").state;
    state = service.acknowledgeNotification(state.unlockEvents().front().id, state);
    state = service.adjustWitnessTrust(def, state, "hannah", -15);
    state = service.submitVerdict({"hannah", "She signed the register. She was there.", {"e4"}}, def, state).state;
    return state;
}

bool ThrowsOnPath(const SnapshotStore& store, const std::string& caseId,
                  const std::string& playerId, const std::string& slot) {
    try {
        store.snapshotPath(caseId, playerId, slot);
    } catch (const PersistenceError&) {
        return true;
    }
    return false;
}

bool ThrowsPersistence(const std::string& text) {
    try {
        SnapshotCodec::DecodeFromString(text);
    } catch (const PersistenceError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Snapshot Round-Trip Test..." << std::endl;

    std::string testRoot = "test_project_root_saves";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    const CaseDefinition def = MakeCeilingCase();
    const PlayerState original = PlayThrough(def);
    assert(original.unlockEvents().size() == 3);
    assert(original.pendingNotificationIds().size() == 2);
    assert(original.discoveredContradictionIds().size() == 1);
    assert(original.hasRevealedSecret("hannah", "s1"));

    auto persistence = std::make_shared<PersistenceService>();
    SnapshotStore store(testRoot, persistence);

    assert(!store.load("ceiling", "alice"));
    store.save("alice", original);

    // Rehydrate
    auto restored = store.load("ceiling", "alice");
    assert(restored && "Snapshot should be rehydrated.");

    // Validate
    assert(restored->caseId() == original.caseId());
    assert(restored->currentLocation() == "library");
    assert(restored->visitedLocations() == original.visitedLocations());
    assert(restored->discoveredEvidenceIds() == original.discoveredEvidenceIds());
    assert(restored->unlockedHypothesisIds() == original.unlockedHypothesisIds());
    assert(restored->pendingNotificationIds() == original.pendingNotificationIds());
    assert(restored->discoveredContradictionIds() == original.discoveredContradictionIds());
    assert(restored->witnessTrust() == original.witnessTrust());
    assert(restored->revealedSecrets() == original.revealedSecrets());
    assert(restored->attemptsRemaining() == 9);
    assert(restored->maxAttempts() == 10);
    assert(restored->investigationPointsSpent() == original.investigationPointsSpent());
    assert(restored->investigationBudget() == original.investigationBudget());
    assert(restored->caseStatus() == CaseStatus::Active);

    const auto& events = restored->unlockEvents();
    assert(events.size() == original.unlockEvents().size());
    for (size_t i = 0; i < events.size(); ++i) {
        const auto& a = events[i];
        const auto& b = original.unlockEvents()[i];
        assert(a.id == b.id && a.hypothesisId == b.hypothesisId);
        assert(a.timestamp == b.timestamp);
        assert(a.acknowledged == b.acknowledged);
        assert(a.cause.index() == b.cause.index());
    }
    assert(restored->verdictAttempts().size() == 1);
    assert(restored->verdictAttempts()[0].accusedId == "hannah");
    assert(!restored->verdictAttempts()[0].fallacies.empty());
    assert(restored->verdictAttempts()[0].fallacies == original.verdictAttempts()[0].fallacies);
    std::cout << "[PASS] Snapshot survives save and load." << std::endl;

    // Encoding is stable.
    assert(SnapshotCodec::EncodeToString(*restored) == SnapshotCodec::EncodeToString(original));

    // Corrupt or inconsistent snapshots are refused.
    assert(ThrowsPersistence("not json"));
    auto tampered = SnapshotCodec::Encode(original);
    tampered["attempts_remaining"] = 10;
    assert(ThrowsPersistence(tampered.dump()));
    auto future = SnapshotCodec::Encode(original);
    future["version"] = SnapshotCodec::kFormatVersion + 1;
    assert(ThrowsPersistence(future.dump()));
    std::cout << "[PASS] Corrupt snapshots raise PersistenceError." << std::endl;

    // A save for another case id at the same path is rejected on load.
    {
        std::ofstream out(store.snapshotPath("ceiling", "mallory"));
        PlayerState other("other-case", "x", 10, 12);
        out << SnapshotCodec::EncodeToString(other);
    }
    bool mismatch = false;
    try {
        store.load("ceiling", "mallory");
    } catch (const PersistenceError&) {
        mismatch = true;
    }
    assert(mismatch);

    // Ids that differ only in punctuation get their own files.
    const PlayerState fresh = InvestigationService::newGame(def, 10);
    assert(store.snapshotPath("ceiling", "alice.smith") != store.snapshotPath("ceiling", "alice_smith"));
    assert(store.snapshotPath("ceiling", "alice.slot_1") != store.snapshotPath("ceiling", "alice", "slot_1"));
    store.save("alice.smith", original);
    store.save("alice_smith", fresh);
    assert(store.load("ceiling", "alice.smith")->discoveredEvidenceIds() == original.discoveredEvidenceIds());
    assert(store.load("ceiling", "alice_smith")->discoveredEvidenceIds().empty());
    assert(ThrowsOnPath(store, "ceiling", "", SnapshotStore::kDefaultSlot));
    std::cout << "[PASS] Player ids never share a save file." << std::endl;

    // Named slots sit beside the default save.
    store.save("alice", original, "slot_1");
    store.save("alice", fresh, "slot_2");
    assert(!store.load("ceiling", "alice", "slot_3"));
    assert(SnapshotCodec::EncodeToString(*store.load("ceiling", "alice", "slot_1")) ==
           SnapshotCodec::EncodeToString(original));
    assert(store.load("ceiling", "alice", "slot_2")->discoveredEvidenceIds().empty());
    assert(store.load("ceiling", "alice")->verdictAttempts().size() == 1);

    {
        std::ofstream out(store.snapshotPath("ceiling", "alice", SnapshotStore::kAutosaveSlot));
        out << "{ truncated";
    }
    auto slots = store.listSlots("ceiling", "alice");
    assert(slots.size() == 2);
    assert(slots[0].slot == "slot_1" && slots[1].slot == "slot_2");
    assert(slots[0].currentLocation == "library");
    assert(slots[0].evidenceCount == static_cast<int>(original.discoveredEvidenceIds().size()));
    assert(slots[0].attemptsRemaining == 9);
    assert(slots[1].evidenceCount == 0);

    assert(store.remove("ceiling", "alice", "slot_2"));
    assert(!store.remove("ceiling", "alice", "slot_2"));
    assert(store.remove("ceiling", "alice", SnapshotStore::kAutosaveSlot));
    assert(store.listSlots("ceiling", "alice").size() == 1);
    assert(store.load("ceiling", "alice"));

    assert(ThrowsOnPath(store, "ceiling", "alice", "slot_9"));
    bool badSlot = false;
    try {
        store.save("alice", original, "../slot_1");
    } catch (const PersistenceError&) {
        badSlot = true;
    }
    assert(badSlot);
    std::cout << "[PASS] Save slots list, load and delete independently." << std::endl;

    // A stopped service fails saves without touching the state.
    persistence->stop();
    bool failed = false;
    try {
        store.save("alice", original);
    } catch (const PersistenceError&) {
        failed = true;
    }
    assert(failed);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Snapshot Round-Trip Test." << std::endl;
    return 0;
}
