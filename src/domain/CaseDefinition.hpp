/**
 * @file CaseDefinition.hpp
 * @brief Immutable description of one playable case.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Requirement.hpp"

namespace casefile::domain {

/**
 * @struct SequenceClaim
 * @brief A chronological claim implied by citing a piece of evidence.
 *
 * Citing the evidence asserts that timeline event `earlier` happened before
 * timeline event `later`.
 */
struct SequenceClaim {
    std::string earlier;
    std::string later;
};

/**
 * @struct Evidence
 * @brief A discoverable clue. Display fields are opaque to the engine.
 */
struct Evidence {
    std::string id;
    std::string locationId;
    std::string name;
    std::string description;
    std::vector<std::string> triggers; ///< Case-insensitive substrings of player input.
    int cost = 0;                      ///< Investigation points spent on discovery.

    // Pass-through metadata for collaborators.
    std::string significance;
    std::optional<int> strength;
    std::vector<std::string> implicates;
    std::vector<std::string> exonerates;

    std::vector<SequenceClaim> impliesSequence;
};

/**
 * @struct NotPresentEntry
 * @brief Things a player may look for that are deliberately absent.
 */
struct NotPresentEntry {
    std::string id;
    std::vector<std::string> triggers;
    std::string response;
};

struct Location {
    std::string id;
    std::string name;
    std::string description;
    std::vector<NotPresentEntry> notPresent;
};

enum class Comparison { Less, LessEqual, Greater, GreaterEqual, Equal, NotEqual };

inline bool Compare(int lhs, Comparison op, int rhs) {
    switch (op) {
        case Comparison::Less: return lhs < rhs;
        case Comparison::LessEqual: return lhs <= rhs;
        case Comparison::Greater: return lhs > rhs;
        case Comparison::GreaterEqual: return lhs >= rhs;
        case Comparison::Equal: return lhs == rhs;
        case Comparison::NotEqual: return lhs != rhs;
    }
    return false;
}

/**
 * @struct SecretCondition
 * @brief One test in a secret trigger: witness trust, a collected clue, or the clue count.
 */
struct SecretCondition {
    enum class Kind { Trust, Evidence, EvidenceCount };

    Kind kind = Kind::Evidence;
    Comparison comparison = Comparison::Greater; ///< Trust and EvidenceCount only.
    int value = 0;
    std::string evidenceId;                      ///< Evidence only.
};

/**
 * @struct SecretTrigger
 * @brief "a AND b OR c": any group fires when all of its conditions hold.
 *
 * A trigger without groups never fires.
 */
struct SecretTrigger {
    std::vector<std::vector<SecretCondition>> anyOf;
};

struct WitnessSecret {
    std::string id;
    std::string text;
    std::string triggerText; ///< As authored, for display and lint messages.
    SecretTrigger trigger;
};

/**
 * @struct WitnessLie
 * @brief Canned false answer on some topics while trust is past a threshold.
 */
struct WitnessLie {
    Comparison comparison = Comparison::Less;
    int trustThreshold = 0;
    std::vector<std::string> topics; ///< Case-insensitive substrings of the question.
    std::string response;
};

struct Witness {
    std::string id;
    std::string name;
    int baseTrust = 50;
    std::string wants;
    std::string fears;
    bool authority = false; ///< Marked as an authority figure for appeal-to-authority checks.
    std::vector<WitnessSecret> secrets;
    std::vector<WitnessLie> lies;

    const WitnessSecret* findSecret(const std::string& secretId) const {
        for (const auto& s : secrets) {
            if (s.id == secretId) return &s;
        }
        return nullptr;
    }
};

/**
 * @struct Hypothesis
 * @brief Tier 1 is always available; tier 2 is gated by a requirement tree.
 */
struct Hypothesis {
    std::string id;
    std::string label;
    std::string description;
    int tier = 1;
    std::optional<Requirement> requirement;
};

struct Contradiction {
    std::string id;
    std::string evidenceA;
    std::string evidenceB;
    std::string description;
};

struct TimelineEntry {
    std::string id;
    std::string time;
    std::string event;
};

struct CommonMistake {
    std::string reason;
    std::string whyWrong;
};

/**
 * @struct CorrelationPair
 * @brief Separates "was there" evidence from evidence that shows guilt.
 */
struct CorrelationPair {
    std::string suspectId;
    std::vector<std::string> presenceEvidence;
    std::vector<std::string> distinguishingEvidence;
};

struct Solution {
    std::string culprit;
    std::string method;
    std::string motive;
    std::vector<std::string> keyEvidence;
    std::vector<std::string> deductions;
    std::map<std::string, CommonMistake> commonMistakes; ///< Accused id -> canned explanation.
    std::map<std::string, std::string> fallacyExamples;  ///< Fallacy key -> example text.
    std::vector<CorrelationPair> correlationPairs;
    std::vector<std::string> counterArgumentKeywords;
};

/**
 * @class CaseDefinition
 * @brief Validated case data shared read-only across sessions.
 */
class CaseDefinition {
public:
    std::string id;
    std::string title;
    std::string difficulty;
    int investigationPoints = 12;
    std::string startLocation;

    std::vector<Location> locations;
    std::vector<Evidence> evidence;
    std::vector<Witness> witnesses;
    std::vector<Hypothesis> hypotheses;
    std::vector<Contradiction> contradictions;
    std::vector<TimelineEntry> timeline;
    Solution solution;

    const Location* findLocation(const std::string& locationId) const {
        for (const auto& loc : locations) {
            if (loc.id == locationId) return &loc;
        }
        return nullptr;
    }

    const Evidence* findEvidence(const std::string& evidenceId) const {
        for (const auto& e : evidence) {
            if (e.id == evidenceId) return &e;
        }
        return nullptr;
    }

    const Witness* findWitness(const std::string& witnessId) const {
        for (const auto& w : witnesses) {
            if (w.id == witnessId) return &w;
        }
        return nullptr;
    }

    const Hypothesis* findHypothesis(const std::string& hypothesisId) const {
        for (const auto& h : hypotheses) {
            if (h.id == hypothesisId) return &h;
        }
        return nullptr;
    }

    /** @brief Evidence placed in a location, in definition order. */
    std::vector<const Evidence*> evidenceInLocation(const std::string& locationId) const {
        std::vector<const Evidence*> result;
        for (const auto& e : evidence) {
            if (e.locationId == locationId) result.push_back(&e);
        }
        return result;
    }

    /** @brief Position of a timeline event, or nullopt for unknown ids. */
    std::optional<size_t> timelineIndex(const std::string& eventId) const {
        for (size_t i = 0; i < timeline.size(); ++i) {
            if (timeline[i].id == eventId) return i;
        }
        return std::nullopt;
    }

    std::set<std::string> authorityFigures() const {
        std::set<std::string> ids;
        for (const auto& w : witnesses) {
            if (w.authority) ids.insert(w.id);
        }
        return ids;
    }
};

} // namespace casefile::domain
