/**
 * @file UnlockEvent.hpp
 * @brief Record of a tier-2 hypothesis becoming available.
 */

#pragma once

#include <chrono>
#include <string>
#include <variant>

#include "Requirement.hpp"

namespace casefile::domain {

struct EvidenceCause {
    static constexpr const char* Type = "evidence_collected";
    std::string evidenceId;
};

struct ThresholdCause {
    static constexpr const char* Type = "threshold_met";
    Metric metric = Metric::EvidenceCount;
    int value = 0;
};

/** @brief Unlock forced outside the requirement tree (debug/test tooling). */
struct ManualUnlock {
    static constexpr const char* Type = "manual_unlock";
};

using UnlockCause = std::variant<EvidenceCause, ThresholdCause, ManualUnlock>;

/**
 * @struct UnlockEvent
 * @brief Append-only log entry. Transitions pending -> acknowledged once.
 */
struct UnlockEvent {
    std::string id;
    std::string hypothesisId;
    UnlockCause cause;
    std::chrono::system_clock::time_point timestamp;
    bool acknowledged = false;
};

inline std::string DescribeCause(const UnlockCause& cause) {
    if (const auto* e = std::get_if<EvidenceCause>(&cause)) {
        return "collected evidence " + e->evidenceId;
    }
    if (const auto* t = std::get_if<ThresholdCause>(&cause)) {
        return MetricToString(t->metric) + " reached " + std::to_string(t->value);
    }
    return "manual unlock";
}

} // namespace casefile::domain
