/**
 * @file UnlockEvaluator.hpp
 * @brief Recursive evaluation of hypothesis requirement trees.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"

namespace casefile::domain::rules {

/**
 * @struct UnlockScan
 * @brief Outcome of one scan: the new events and the state with all of them applied.
 */
struct UnlockScan {
    std::vector<UnlockEvent> events;
    std::vector<std::string> newContradictionIds;
    PlayerState state;
};

/**
 * @class UnlockEvaluator
 * @brief Pure, total evaluator over Requirement trees.
 *
 * Trees hold their children by value and are therefore finite. Nesting deeper
 * than kMaxDepth is treated as malformed and evaluates to false.
 */
class UnlockEvaluator {
public:
    static constexpr int kMaxDepth = 32;

    static bool evaluate(const Requirement& requirement, const PlayerState& state);

    /** @brief Current value of a metric read from the state counters. */
    static int metricValue(Metric metric, const PlayerState& state);

    /** @brief Tier 1: always. Tier 2: evaluate(requirement). Anything else: never. */
    static bool isHypothesisUnlocked(const Hypothesis& hypothesis, const PlayerState& state);

    /**
     * @brief Tier-2 ids whose requirement holds and that are not yet in the unlocked set.
     *
     * Running it again without a state change returns an empty list.
     */
    static std::vector<std::string> findNewlyUnlocked(const std::vector<Hypothesis>& hypotheses,
                                                      const PlayerState& state);

    /**
     * @brief Picks the leaf that best explains why the requirement holds.
     *
     * Prefers the most recently discovered evidence, then a satisfied
     * threshold, then any satisfied evidence leaf.
     */
    static UnlockCause explainCause(const Requirement& requirement, const PlayerState& state);

    /**
     * @brief Finds new unlocks and applies them as one batch.
     *
     * For each newly unlocked hypothesis exactly one event is appended, the id
     * is marked unlocked and the event is queued as a pending notification.
     * Newly discoverable contradictions are recorded in the same transition.
     */
    static UnlockScan scanUnlocks(const CaseDefinition& caseDef,
                                  PlayerState state,
                                  std::chrono::system_clock::time_point now);

    /**
     * @brief Unlocks a tier-2 hypothesis regardless of its requirement.
     *
     * Unknown ids and already unlocked hypotheses leave the state unchanged.
     */
    static UnlockScan forceUnlock(const CaseDefinition& caseDef,
                                  PlayerState state,
                                  const std::string& hypothesisId,
                                  std::chrono::system_clock::time_point now);

private:
    static bool evaluateAt(const Requirement& requirement, const PlayerState& state, int depth);
    static std::string nextEventId(const PlayerState& state);
};

} // namespace casefile::domain::rules
