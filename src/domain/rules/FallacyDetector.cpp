/**
 * @file FallacyDetector.cpp
 * @brief Implementation of FallacyDetector.
 */

#include "domain/rules/FallacyDetector.hpp"
#include "domain/rules/TextMatching.hpp"

#include <algorithm>
#include <iostream>

namespace casefile::domain::rules {

namespace {

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::string ExampleFor(FallacyKind kind, const Solution& solution) {
    auto it = solution.fallacyExamples.find(FallacyToString(kind));
    if (it != solution.fallacyExamples.end()) return it->second;
    // Older case files use "authority_bias".
    if (kind == FallacyKind::AppealToAuthority) {
        it = solution.fallacyExamples.find("authority_bias");
        if (it != solution.fallacyExamples.end()) return it->second;
    }
    return {};
}

} // namespace

const std::vector<std::string>& FallacyDetector::defaultCounterArgumentKeywords() {
    static const std::vector<std::string> keywords = {
        "however",
        "although",
        "despite",
        "even though",
        "nevertheless",
        "on the other hand",
        "regardless of",
        "confirmed by",
        "verified",
        "contradicts",
        "proves"
    };
    return keywords;
}

const std::vector<std::string>& FallacyDetector::weakReasoningPhrases() {
    static const std::vector<std::string> phrases = {
        "i guess",
        "i think maybe",
        "probably",
        "not sure",
        "i don't know",
        "no idea",
        "just a feeling",
        "maybe it was",
        "could be",
        "might have",
        "just seems",
        "i assume",
        "gut feeling",
        "seems like",
        "no reason",
        "no real reason"
    };
    return phrases;
}

std::vector<DetectedFallacy> FallacyDetector::detect(const Accusation& accusation, const CaseDefinition& caseDef) {
    const Solution& solution = caseDef.solution;
    std::vector<DetectedFallacy> found;

    auto report = [&](FallacyKind kind, bool hit) {
        if (hit) found.push_back({kind, ExampleFor(kind, solution)});
    };

    report(FallacyKind::ConfirmationBias, confirmationBias(accusation.citedEvidenceIds, solution));
    report(FallacyKind::CorrelationNotCausation,
           correlationNotCausation(accusation.accusedId, accusation.citedEvidenceIds, solution));
    report(FallacyKind::AppealToAuthority, appealToAuthority(accusation.accusedId, accusation.reasoning, caseDef));
    report(FallacyKind::PostHoc, postHoc(accusation.citedEvidenceIds, caseDef));
    report(FallacyKind::WeakReasoning, weakReasoning(accusation.reasoning));

    return found;
}

bool FallacyDetector::confirmationBias(const std::vector<std::string>& citedEvidenceIds, const Solution& solution) {
    if (solution.keyEvidence.empty()) return false;

    size_t citedKey = 0;
    for (const auto& key : solution.keyEvidence) {
        if (Contains(citedEvidenceIds, key)) ++citedKey;
    }
    // citedKey / total < 0.5, kept in integers.
    return citedKey * 2 < solution.keyEvidence.size();
}

bool FallacyDetector::correlationNotCausation(const std::string& accusedId,
                                              const std::vector<std::string>& citedEvidenceIds,
                                              const Solution& solution) {
    if (citedEvidenceIds.empty()) return false;

    for (const auto& pair : solution.correlationPairs) {
        if (pair.suspectId != accusedId) continue;
        if (pair.presenceEvidence.empty()) continue;

        bool onlyPresence = true;
        for (const auto& id : citedEvidenceIds) {
            if (!Contains(pair.presenceEvidence, id)) {
                onlyPresence = false;
                break;
            }
        }
        if (!onlyPresence) continue;

        bool distinguishing = false;
        for (const auto& id : citedEvidenceIds) {
            if (Contains(pair.distinguishingEvidence, id)) {
                distinguishing = true;
                break;
            }
        }
        if (!distinguishing) return true;
    }
    return false;
}

bool FallacyDetector::appealToAuthority(const std::string& accusedId,
                                        const std::string& reasoning,
                                        const CaseDefinition& caseDef) {
    const auto authorities = caseDef.authorityFigures();
    if (authorities.empty()) return false;

    const bool culpritIsAuthority = authorities.count(caseDef.solution.culprit) > 0;
    const bool accusedIsAuthority = authorities.count(accusedId) > 0;
    if (culpritIsAuthority == accusedIsAuthority) return false;

    const std::string lowered = ToLower(reasoning);
    if (ContainsAnyLowered(lowered, defaultCounterArgumentKeywords())) return false;
    if (ContainsAnyLowered(lowered, caseDef.solution.counterArgumentKeywords)) return false;
    return true;
}

bool FallacyDetector::postHoc(const std::vector<std::string>& citedEvidenceIds, const CaseDefinition& caseDef) {
    for (const auto& id : citedEvidenceIds) {
        const Evidence* evidence = caseDef.findEvidence(id);
        if (!evidence) continue;

        for (const auto& claim : evidence->impliesSequence) {
            const auto earlier = caseDef.timelineIndex(claim.earlier);
            const auto later = caseDef.timelineIndex(claim.later);
            if (!earlier || !later) {
                std::cerr << "[FallacyDetector] Evidence '" << id << "' refers to unknown timeline event ("
                          << claim.earlier << " -> " << claim.later << "); ignored." << std::endl;
                continue;
            }
            if (*earlier >= *later) return true;
        }
    }
    return false;
}

bool FallacyDetector::weakReasoning(const std::string& reasoning) {
    return ContainsAnyLowered(ToLower(reasoning), weakReasoningPhrases());
}

} // namespace casefile::domain::rules
