#include <cassert>
#include <iostream>

#include "domain/rules/NotificationQueue.hpp"
#include "domain/rules/UnlockEvaluator.hpp"
#include "TestFixtures.hpp"

using namespace casefile::domain;
using namespace casefile::domain::rules;
using namespace casefile::test;

int main() {
    std::cout << "[Test] Starting NotificationQueue Test..." << std::endl;

    const CaseDefinition def = MakeCeilingCase();
    PlayerState state = NewCeilingGame(def);
    state = UnlockEvaluator::forceUnlock(def, state, "h3", FixedTime()).state;
    state = UnlockEvaluator::forceUnlock(def, state, "h5", FixedTime()).state;

    auto pending = NotificationQueue::pendingNotifications(def, state);
    assert(pending.size() == 2);
    assert(pending[0].eventId == "ceiling-evt-1");
    assert(pending[0].hypothesisLabel == "The spell came from above");
    assert(pending[0].cause == "manual unlock");
    assert(pending[1].hypothesisId == "h5");
    std::cout << "[PASS] Pending notifications listed in log order." << std::endl;

    state = NotificationQueue::acknowledge("ceiling-evt-1", state);
    assert(NotificationQueue::pending(state).size() == 1);
    assert(state.unlockEvents().size() == 2);
    assert(state.unlockEvents()[0].acknowledged);
    assert(state.isUnlocked("h3"));
    std::cout << "[PASS] Acknowledging keeps the event and the unlock." << std::endl;

    // Unknown and repeated ids change nothing.
    PlayerState before = state;
    state = NotificationQueue::acknowledge("ceiling-evt-1", state);
    state = NotificationQueue::acknowledge("no-such-event", state);
    assert(state.pendingNotificationIds() == before.pendingNotificationIds());
    assert(state.unlockEvents().size() == before.unlockEvents().size());
    std::cout << "[PASS] Unknown acknowledgments are ignored." << std::endl;

    state = NotificationQueue::acknowledgeAll(state);
    assert(NotificationQueue::pending(state).empty());
    assert(state.unlockEvents()[1].acknowledged);
    std::cout << "[PASS] acknowledgeAll drains the queue." << std::endl;

    std::cout << "[PASS] NotificationQueue Test." << std::endl;
    return 0;
}
