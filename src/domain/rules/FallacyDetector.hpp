/**
 * @file FallacyDetector.hpp
 * @brief Rule-based heuristics that flag reasoning defects in an accusation.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/CaseDefinition.hpp"
#include "domain/Verdict.hpp"

namespace casefile::domain::rules {

/**
 * @class FallacyDetector
 * @brief Independent, deterministic heuristics.
 *
 * Every check runs on every accusation, correct or not. Results are reported
 * in FallacyKind declaration order so identical input yields identical output.
 */
class FallacyDetector {
public:
    /** @brief Runs every check and attaches case-specific example text. */
    static std::vector<DetectedFallacy> detect(const Accusation& accusation, const CaseDefinition& caseDef);

    /** @brief Fewer than half of the key evidence ids were cited. False when the case has no key evidence. */
    static bool confirmationBias(const std::vector<std::string>& citedEvidenceIds, const Solution& solution);

    /**
     * @brief Cited evidence only places the accused at the scene.
     *
     * Uses the case's correlation pairs for the accused: fires when every
     * cited id is presence evidence and none is distinguishing evidence.
     */
    static bool correlationNotCausation(const std::string& accusedId,
                                        const std::vector<std::string>& citedEvidenceIds,
                                        const Solution& solution);

    /**
     * @brief Exactly one of (culprit, accused) is an authority figure and the
     *        reasoning never argues against that status.
     */
    static bool appealToAuthority(const std::string& accusedId,
                                  const std::string& reasoning,
                                  const CaseDefinition& caseDef);

    /** @brief A cited item implies an ordering the case timeline contradicts. */
    static bool postHoc(const std::vector<std::string>& citedEvidenceIds, const CaseDefinition& caseDef);

    /** @brief Hedging phrases ("i guess", "gut feeling", ...) in the reasoning. */
    static bool weakReasoning(const std::string& reasoning);

    static const std::vector<std::string>& defaultCounterArgumentKeywords();
    static const std::vector<std::string>& weakReasoningPhrases();
};

} // namespace casefile::domain::rules
