/**
 * @file UnlockEvaluator.cpp
 * @brief Implementation of UnlockEvaluator.
 */

#include "domain/rules/UnlockEvaluator.hpp"
#include "domain/rules/ContradictionTracker.hpp"

#include <cmath>
#include <iostream>
#include <type_traits>

namespace casefile::domain::rules {

namespace {

struct SatisfiedLeaves {
    std::vector<std::string> evidence;
    std::vector<ThresholdMet> thresholds;
};

void CollectSatisfied(const Requirement& requirement, const PlayerState& state, int depth, SatisfiedLeaves& out) {
    if (depth > UnlockEvaluator::kMaxDepth) return;
    std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, EvidenceCollected>) {
            if (state.hasDiscovered(node.evidenceId)) out.evidence.push_back(node.evidenceId);
        } else if constexpr (std::is_same_v<T, ThresholdMet>) {
            if (node.metric && UnlockEvaluator::metricValue(*node.metric, state) >= node.threshold) {
                out.thresholds.push_back(node);
            }
        } else {
            for (const auto& child : node.children) {
                CollectSatisfied(child, state, depth + 1, out);
            }
        }
    }, requirement.node);
}

} // namespace

int UnlockEvaluator::metricValue(Metric metric, const PlayerState& state) {
    switch (metric) {
        case Metric::EvidenceCount:
            return static_cast<int>(state.discoveredEvidenceIds().size());
        case Metric::InvestigationPointsSpent:
            return state.investigationPointsSpent();
        case Metric::InvestigationProgress: {
            const int budget = state.investigationBudget();
            if (budget <= 0) return 100;
            const double pct = 100.0 * state.investigationPointsSpent() / budget;
            return static_cast<int>(std::lround(pct));
        }
    }
    return 0;
}

bool UnlockEvaluator::evaluate(const Requirement& requirement, const PlayerState& state) {
    return evaluateAt(requirement, state, 0);
}

bool UnlockEvaluator::evaluateAt(const Requirement& requirement, const PlayerState& state, int depth) {
    if (depth > kMaxDepth) {
        std::cerr << "[UnlockEvaluator] Requirement nesting exceeds " << kMaxDepth
                  << " levels; treating it as unmet." << std::endl;
        return false;
    }

    return std::visit([&](const auto& node) -> bool {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, EvidenceCollected>) {
            return state.hasDiscovered(node.evidenceId);
        } else if constexpr (std::is_same_v<T, ThresholdMet>) {
            if (!node.metric) {
                std::cerr << "[UnlockEvaluator] Unknown metric '" << node.rawMetricName
                          << "'; threshold treated as unmet." << std::endl;
                return false;
            }
            return metricValue(*node.metric, state) >= node.threshold;
        } else if constexpr (std::is_same_v<T, AllOf>) {
            for (const auto& child : node.children) {
                if (!evaluateAt(child, state, depth + 1)) return false;
            }
            return true;
        } else {
            static_assert(std::is_same_v<T, AnyOf>, "unhandled requirement kind");
            for (const auto& child : node.children) {
                if (evaluateAt(child, state, depth + 1)) return true;
            }
            return false;
        }
    }, requirement.node);
}

bool UnlockEvaluator::isHypothesisUnlocked(const Hypothesis& hypothesis, const PlayerState& state) {
    if (hypothesis.tier == 1) return true;
    if (hypothesis.tier != 2) {
        std::cerr << "[UnlockEvaluator] Hypothesis '" << hypothesis.id << "' has unsupported tier "
                  << hypothesis.tier << "; kept locked." << std::endl;
        return false;
    }
    if (!hypothesis.requirement) {
        std::cerr << "[UnlockEvaluator] Tier-2 hypothesis '" << hypothesis.id
                  << "' has no requirement; kept locked." << std::endl;
        return false;
    }
    return evaluate(*hypothesis.requirement, state);
}

std::vector<std::string> UnlockEvaluator::findNewlyUnlocked(const std::vector<Hypothesis>& hypotheses,
                                                            const PlayerState& state) {
    std::vector<std::string> ids;
    for (const auto& hypothesis : hypotheses) {
        if (hypothesis.tier != 2) continue;
        if (state.isUnlocked(hypothesis.id)) continue;
        if (isHypothesisUnlocked(hypothesis, state)) {
            ids.push_back(hypothesis.id);
        }
    }
    return ids;
}

UnlockCause UnlockEvaluator::explainCause(const Requirement& requirement, const PlayerState& state) {
    SatisfiedLeaves leaves;
    CollectSatisfied(requirement, state, 0, leaves);

    const std::string last = state.lastDiscoveredEvidenceId();
    for (const auto& id : leaves.evidence) {
        if (id == last) return EvidenceCause{id};
    }
    if (!leaves.thresholds.empty()) {
        const auto& t = leaves.thresholds.front();
        return ThresholdCause{*t.metric, metricValue(*t.metric, state)};
    }
    if (!leaves.evidence.empty()) {
        return EvidenceCause{leaves.evidence.front()};
    }
    return ThresholdCause{Metric::EvidenceCount, metricValue(Metric::EvidenceCount, state)};
}

std::string UnlockEvaluator::nextEventId(const PlayerState& state) {
    return state.caseId() + "-evt-" + std::to_string(state.unlockEvents().size() + 1);
}

UnlockScan UnlockEvaluator::scanUnlocks(const CaseDefinition& caseDef,
                                        PlayerState state,
                                        std::chrono::system_clock::time_point now) {
    UnlockScan scan;

    // Decide everything against the incoming snapshot, then apply as one batch.
    const auto newlyUnlocked = findNewlyUnlocked(caseDef.hypotheses, state);
    const auto newContradictions = ContradictionTracker::findNewlyDiscovered(caseDef.contradictions, state);

    std::vector<UnlockEvent> pendingEvents;
    for (const auto& id : newlyUnlocked) {
        const Hypothesis* hypothesis = caseDef.findHypothesis(id);
        UnlockEvent evt;
        evt.hypothesisId = id;
        evt.cause = explainCause(*hypothesis->requirement, state);
        evt.timestamp = now;
        pendingEvents.push_back(evt);
    }

    for (auto& evt : pendingEvents) {
        evt.id = nextEventId(state);
        if (state.recordUnlock(evt)) {
            scan.events.push_back(evt);
        }
    }
    for (const auto& id : newContradictions) {
        if (state.addContradiction(id)) {
            scan.newContradictionIds.push_back(id);
        }
    }

    if (!scan.events.empty()) {
        std::cout << "[UnlockEvaluator] Unlocked " << scan.events.size() << " hypothesis(es) in case '"
                  << caseDef.id << "'." << std::endl;
    }

    scan.state = std::move(state);
    return scan;
}

UnlockScan UnlockEvaluator::forceUnlock(const CaseDefinition& caseDef,
                                        PlayerState state,
                                        const std::string& hypothesisId,
                                        std::chrono::system_clock::time_point now) {
    UnlockScan scan;
    const Hypothesis* hypothesis = caseDef.findHypothesis(hypothesisId);
    if (!hypothesis) {
        std::cerr << "[UnlockEvaluator] Unknown hypothesis '" << hypothesisId
                  << "'; manual unlock ignored." << std::endl;
    } else if (hypothesis->tier == 2 && !state.isUnlocked(hypothesisId)) {
        UnlockEvent evt;
        evt.id = nextEventId(state);
        evt.hypothesisId = hypothesisId;
        evt.cause = ManualUnlock{};
        evt.timestamp = now;
        if (state.recordUnlock(evt)) {
            scan.events.push_back(evt);
        }
    }
    scan.state = std::move(state);
    return scan;
}

} // namespace casefile::domain::rules
