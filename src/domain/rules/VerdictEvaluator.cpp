/**
 * @file VerdictEvaluator.cpp
 * @brief Implementation of VerdictEvaluator.
 */

#include "domain/rules/VerdictEvaluator.hpp"
#include "domain/rules/FallacyDetector.hpp"
#include "domain/rules/TextMatching.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace casefile::domain::rules {

namespace {

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

size_t CountCitedKey(const std::vector<std::string>& cited, const Solution& solution) {
    size_t n = 0;
    for (const auto& key : solution.keyEvidence) {
        if (Contains(cited, key)) ++n;
    }
    return n;
}

std::string JoinFallacies(const std::vector<DetectedFallacy>& fallacies) {
    std::string out;
    for (size_t i = 0; i < fallacies.size(); ++i) {
        if (i > 0) out += ", ";
        out += FallacyToString(fallacies[i].kind);
    }
    return out;
}

} // namespace

std::optional<std::string> VerdictEvaluator::validateAccusation(const Accusation& accusation) {
    if (Trim(accusation.accusedId).empty()) {
        return std::string("An accusation must name a suspect.");
    }
    if (Trim(accusation.reasoning).empty()) {
        return std::string("An accusation must explain the reasoning behind it.");
    }
    return std::nullopt;
}

int VerdictEvaluator::scoreReasoning(bool correct,
                                     const std::string& reasoning,
                                     const std::vector<std::string>& citedEvidenceIds,
                                     const Solution& solution,
                                     size_t fallacyCount) {
    int score = correct ? kCorrectWeight : 0;

    const size_t totalKey = solution.keyEvidence.size();
    const size_t citedKey = CountCitedKey(citedEvidenceIds, solution);
    if (totalKey > 0) {
        score += static_cast<int>(std::lround(static_cast<double>(kKeyEvidenceWeight) * citedKey / totalKey));
        if (citedEvidenceIds.empty()) score -= kNoEvidencePenalty;
    }

    const int sentences = CountSentences(reasoning);
    if (sentences >= 2 && sentences <= 5) {
        score += kStructureWeight;
    } else if (sentences > 5) {
        score += kRamblingWeight;
    }
    if (CountNonSpace(reasoning) >= kDetailMinChars) score += kDetailWeight;

    score -= std::min(kMaxFallacyPenalty, static_cast<int>(fallacyCount) * kFallacyPenalty);

    if (totalKey > 0 && citedKey == 0) score = std::min(score, kNoKeyEvidenceCap);
    return std::max(0, std::min(100, score));
}

std::string VerdictEvaluator::qualityFor(int score) {
    if (score >= 90) return "excellent";
    if (score >= 75) return "good";
    if (score >= 60) return "fair";
    if (score >= 40) return "poor";
    return "failing";
}

FeedbackTone VerdictEvaluator::toneFor(int attemptsRemaining) {
    if (attemptsRemaining >= 7) return FeedbackTone::Vague;
    if (attemptsRemaining >= 4) return FeedbackTone::Specific;
    return FeedbackTone::Direct;
}

std::string VerdictEvaluator::hintFor(FeedbackTone tone, const Solution& solution) {
    switch (tone) {
        case FeedbackTone::Vague:
            return "Think harder. Review all evidence carefully.";
        case FeedbackTone::Specific: {
            if (solution.keyEvidence.empty()) return "Focus on the key evidence.";
            std::string ids = solution.keyEvidence[0];
            if (solution.keyEvidence.size() > 1) ids += ", " + solution.keyEvidence[1];
            return "Focus on the key evidence: " + ids + ".";
        }
        case FeedbackTone::Direct: {
            const std::string method = solution.method.empty() ? std::string("method") : ToLower(solution.method);
            return "The " + method + " points directly to the culprit. Check who had the capability.";
        }
    }
    return {};
}

VerdictResult VerdictEvaluator::evaluateVerdict(const Accusation& accusation,
                                                const CaseDefinition& caseDef,
                                                const PlayerState& state) {
    VerdictResult result;
    if (auto rejection = validateAccusation(accusation)) {
        result.accepted = false;
        result.rejectionReason = *rejection;
        result.attemptsRemaining = state.attemptsRemaining();
        result.caseStatus = state.caseStatus();
        result.tone = toneFor(state.attemptsRemaining());
        return result;
    }

    const Solution& solution = caseDef.solution;
    for (const auto& id : accusation.citedEvidenceIds) {
        if (!caseDef.findEvidence(id)) {
            std::cerr << "[VerdictEvaluator] Cited evidence '" << id << "' is not part of case '"
                      << caseDef.id << "'; it earns nothing." << std::endl;
        }
    }

    result.correct = (accusation.accusedId == solution.culprit);
    result.fallacies = FallacyDetector::detect(accusation, caseDef);
    result.score = scoreReasoning(result.correct, accusation.reasoning, accusation.citedEvidenceIds, solution,
                                  result.fallacies.size());
    result.quality = qualityFor(result.score);

    for (const auto& key : solution.keyEvidence) {
        if (!Contains(accusation.citedEvidenceIds, key)) result.missingEvidence.push_back(key);
    }

    // Attempt bookkeeping as it will look once recorded.
    result.attemptsRemaining = std::max(0, state.attemptsRemaining() - 1);
    result.tone = toneFor(result.attemptsRemaining);

    if (result.correct) {
        result.feedback = "Correct. The evidence supports your accusation.";
        if (!result.fallacies.empty()) {
            result.feedback += " Your reasoning still showed: " + JoinFallacies(result.fallacies) + ".";
        }
    } else {
        auto mistake = solution.commonMistakes.find(accusation.accusedId);
        if (mistake != solution.commonMistakes.end()) {
            result.feedback = mistake->second.reason;
            result.whyWrong = mistake->second.whyWrong;
        } else {
            result.feedback = "Incorrect. The evidence does not support accusing " + accusation.accusedId + ".";
        }
        result.hint = hintFor(result.tone, solution);
    }

    if (state.caseStatus() != CaseStatus::Active) {
        result.caseStatus = state.caseStatus();
    } else if (result.correct) {
        result.caseStatus = CaseStatus::Solved;
    } else if (result.attemptsRemaining == 0) {
        result.caseStatus = CaseStatus::FailedSolvedByMentor;
    } else {
        result.caseStatus = CaseStatus::Active;
    }

    if (result.attemptsRemaining == 0) {
        result.revealedCulprit = solution.culprit;
        if (!result.correct) {
            result.feedback += " The actual culprit was " + solution.culprit + ".";
            if (!solution.method.empty()) result.feedback += " " + solution.method;
        }
    }

    return result;
}

VerdictOutcome VerdictEvaluator::submitVerdict(const Accusation& accusation,
                                               const CaseDefinition& caseDef,
                                               PlayerState state,
                                               std::chrono::system_clock::time_point now) {
    VerdictOutcome outcome;
    outcome.result = evaluateVerdict(accusation, caseDef, state);

    if (!outcome.result.accepted) {
        std::cerr << "[VerdictEvaluator] Accusation rejected: " << outcome.result.rejectionReason << std::endl;
        outcome.state = std::move(state);
        return outcome;
    }

    VerdictAttempt attempt;
    attempt.accusedId = accusation.accusedId;
    attempt.reasoning = accusation.reasoning;
    attempt.citedEvidenceIds = accusation.citedEvidenceIds;
    attempt.correct = outcome.result.correct;
    attempt.score = outcome.result.score;
    for (const auto& f : outcome.result.fallacies) {
        attempt.fallacies.push_back(f.kind);
    }
    attempt.timestamp = now;

    state.recordVerdictAttempt(attempt);
    state.setCaseStatus(outcome.result.caseStatus);

    std::cout << "[VerdictEvaluator] Attempt on case '" << caseDef.id << "': "
              << (attempt.correct ? "correct" : "incorrect") << ", score " << attempt.score
              << ", " << state.attemptsRemaining() << " attempt(s) left." << std::endl;

    outcome.state = std::move(state);
    return outcome;
}

} // namespace casefile::domain::rules
