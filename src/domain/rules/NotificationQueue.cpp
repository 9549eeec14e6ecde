/**
 * @file NotificationQueue.cpp
 * @brief Implementation of NotificationQueue.
 */

#include "domain/rules/NotificationQueue.hpp"

namespace casefile::domain::rules {

std::vector<UnlockEvent> NotificationQueue::pending(const PlayerState& state) {
    std::vector<UnlockEvent> result;
    for (const auto& evt : state.unlockEvents()) {
        if (state.isPending(evt.id)) {
            result.push_back(evt);
        }
    }
    return result;
}

std::vector<UnlockNotification> NotificationQueue::pendingNotifications(const CaseDefinition& caseDef,
                                                                        const PlayerState& state) {
    std::vector<UnlockNotification> result;
    for (const auto& evt : pending(state)) {
        const Hypothesis* hypothesis = caseDef.findHypothesis(evt.hypothesisId);
        if (!hypothesis) continue;
        result.push_back({evt.id, evt.hypothesisId, hypothesis->label, DescribeCause(evt.cause)});
    }
    return result;
}

PlayerState NotificationQueue::acknowledge(const std::string& eventId, PlayerState state) {
    state.acknowledge(eventId);
    return state;
}

PlayerState NotificationQueue::acknowledgeAll(PlayerState state) {
    const auto ids = state.pendingNotificationIds();
    for (const auto& id : ids) {
        state.acknowledge(id);
    }
    return state;
}

} // namespace casefile::domain::rules
