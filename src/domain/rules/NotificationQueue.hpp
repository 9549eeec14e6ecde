/**
 * @file NotificationQueue.hpp
 * @brief Pending/acknowledged view over the unlock event log.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"

namespace casefile::domain::rules {

/**
 * @struct UnlockNotification
 * @brief A pending event paired with the label the player should see.
 */
struct UnlockNotification {
    std::string eventId;
    std::string hypothesisId;
    std::string hypothesisLabel;
    std::string cause;
};

/**
 * @class NotificationQueue
 * @brief Derived view; nothing is stored apart from the PlayerState itself.
 */
class NotificationQueue {
public:
    /** @brief Events still waiting for acknowledgment, in log order. */
    static std::vector<UnlockEvent> pending(const PlayerState& state);

    /** @brief Pending events joined with hypothesis labels. Events whose hypothesis is unknown are skipped. */
    static std::vector<UnlockNotification> pendingNotifications(const CaseDefinition& caseDef,
                                                                const PlayerState& state);

    /**
     * @brief Marks an event acknowledged and removes it from the pending set.
     *
     * Unknown and already acknowledged ids are silently ignored.
     */
    static PlayerState acknowledge(const std::string& eventId, PlayerState state);

    /** @brief Acknowledges every pending event. */
    static PlayerState acknowledgeAll(PlayerState state);
};

} // namespace casefile::domain::rules
