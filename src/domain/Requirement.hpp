/**
 * @file Requirement.hpp
 * @brief Boolean requirement trees gating tier-2 hypotheses.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace casefile::domain {

/**
 * @enum Metric
 * @brief Numeric counters a ThresholdMet requirement may read.
 */
enum class Metric {
    EvidenceCount,            ///< Number of discovered evidence ids.
    InvestigationPointsSpent, ///< Investigation points spent so far.
    InvestigationProgress     ///< Spent points as a percentage (0-100) of the case budget.
};

inline std::string MetricToString(Metric metric) {
    switch (metric) {
        case Metric::EvidenceCount: return "evidenceCount";
        case Metric::InvestigationPointsSpent: return "investigationPointsSpent";
        case Metric::InvestigationProgress: return "investigationProgress";
    }
    return "evidenceCount";
}

/**
 * @brief Parses a metric name from external data.
 *
 * Accepts the camelCase names, the snake_case spellings used by case files
 * and the legacy "ipSpent" alias. Anything else yields std::nullopt.
 */
inline std::optional<Metric> MetricFromString(const std::string& name) {
    if (name == "evidenceCount" || name == "evidence_count") return Metric::EvidenceCount;
    if (name == "investigationPointsSpent" || name == "investigation_points_spent" ||
        name == "ipSpent" || name == "ip_spent") {
        return Metric::InvestigationPointsSpent;
    }
    if (name == "investigationProgress" || name == "investigation_progress") {
        return Metric::InvestigationProgress;
    }
    return std::nullopt;
}

struct Requirement;

/** @brief True once the evidence id is in the discovered set. */
struct EvidenceCollected {
    std::string evidenceId;
};

/**
 * @brief True once the metric's current value is >= threshold.
 *
 * metric is empty when the case file named a metric outside the enumerated
 * set; such a leaf always evaluates false.
 */
struct ThresholdMet {
    std::optional<Metric> metric;
    int threshold = 0;
    std::string rawMetricName; ///< Name as written in the case file, for diagnostics.
};

/** @brief True iff every child is true. Empty means true. */
struct AllOf {
    std::vector<Requirement> children;
};

/** @brief True iff at least one child is true. Empty means false. */
struct AnyOf {
    std::vector<Requirement> children;
};

/**
 * @struct Requirement
 * @brief Closed sum over the four requirement kinds.
 *
 * Children are held by value, so a tree is always finite and acyclic.
 */
struct Requirement {
    using Node = std::variant<EvidenceCollected, ThresholdMet, AllOf, AnyOf>;
    Node node;

    static Requirement Evidence(std::string evidenceId) {
        return Requirement{EvidenceCollected{std::move(evidenceId)}};
    }

    static Requirement Threshold(Metric metric, int threshold) {
        return Requirement{ThresholdMet{metric, threshold, MetricToString(metric)}};
    }

    static Requirement All(std::vector<Requirement> children) {
        return Requirement{AllOf{std::move(children)}};
    }

    static Requirement Any(std::vector<Requirement> children) {
        return Requirement{AnyOf{std::move(children)}};
    }
};

} // namespace casefile::domain
