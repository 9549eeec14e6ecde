/**
 * @file VerdictEvaluator.hpp
 * @brief Correctness, scoring rubric and attempt bookkeeping for accusations.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"
#include "domain/Verdict.hpp"

namespace casefile::domain::rules {

/**
 * @struct VerdictOutcome
 * @brief Result of a submission plus the state with the attempt recorded.
 */
struct VerdictOutcome {
    VerdictResult result;
    PlayerState state;
};

/**
 * @class VerdictEvaluator
 * @brief Scores an accusation against the case solution.
 *
 * Rubric weights:
 * - correct accusation +40
 * - key evidence: round(30 * citedKey / totalKey)
 * - structure: 2-5 sentences +20, more than 5 +10; 60+ non-space chars +10
 * - nothing cited while key evidence exists -15
 * - -15 per fallacy, at most -45
 * - capped at 30 when key evidence exists and none of it is cited
 * - clamped to [0, 100]
 */
class VerdictEvaluator {
public:
    static constexpr int kCorrectWeight = 40;
    static constexpr int kKeyEvidenceWeight = 30;
    static constexpr int kStructureWeight = 20;
    static constexpr int kRamblingWeight = 10;
    static constexpr int kDetailWeight = 10;
    static constexpr int kDetailMinChars = 60;
    static constexpr int kNoEvidencePenalty = 15;
    static constexpr int kFallacyPenalty = 15;
    static constexpr int kMaxFallacyPenalty = 45;
    static constexpr int kNoKeyEvidenceCap = 30;

    /** @brief Rejection message for an invalid accusation, nullopt if it may be evaluated. */
    static std::optional<std::string> validateAccusation(const Accusation& accusation);

    /**
     * @brief Pure evaluation against the state as it is before the attempt.
     *
     * attemptsRemaining, tone, caseStatus and revealedCulprit describe the
     * state after the attempt would be recorded. Repeated calls with the same
     * arguments return equal results.
     */
    static VerdictResult evaluateVerdict(const Accusation& accusation,
                                         const CaseDefinition& caseDef,
                                         const PlayerState& state);

    /**
     * @brief Evaluates and records the attempt.
     *
     * A rejected accusation leaves the state untouched.
     */
    static VerdictOutcome submitVerdict(const Accusation& accusation,
                                        const CaseDefinition& caseDef,
                                        PlayerState state,
                                        std::chrono::system_clock::time_point now);

    static int scoreReasoning(bool correct,
                              const std::string& reasoning,
                              const std::vector<std::string>& citedEvidenceIds,
                              const Solution& solution,
                              size_t fallacyCount);

    static std::string qualityFor(int score);
    static FeedbackTone toneFor(int attemptsRemaining);
    static std::string hintFor(FeedbackTone tone, const Solution& solution);
};

} // namespace casefile::domain::rules
