/**
 * @file WitnessRules.hpp
 * @brief Interrogation rules: tone-based trust, secret triggers, lies and evidence presentation.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"

namespace casefile::domain::rules {

/**
 * @class WitnessRules
 * @brief Pure decisions about a witness under questioning. No state is modified.
 */
class WitnessRules {
public:
    static constexpr int kAggressivePenalty = -10;
    static constexpr int kEmpatheticBonus = 5;
    static constexpr int kPresentationBonus = 5;

    /**
     * @brief Trust change caused by the tone of a question.
     *
     * Aggressive wording wins over empathetic wording in the same question.
     */
    static int trustDelta(const std::string& question);

    /**
     * @brief Parses "evidence:e1 AND trust>70 OR evidence_count>=3".
     *
     * OR binds looser than AND. Keywords are case-insensitive. Parts that are
     * not a recognised condition are skipped and, if @p unparsed is given,
     * appended to it. A group left with no conditions is dropped.
     */
    static SecretTrigger parseTrigger(const std::string& text, std::vector<std::string>* unparsed = nullptr);

    /** @brief Parses a single "trust<N" style condition, as used by lies. */
    static std::optional<SecretCondition> parseTrustCondition(const std::string& text);

    static bool evaluate(const SecretTrigger& trigger, int trust, const PlayerState& state);

    /** @brief Trust counter of the witness, or its base trust when untouched. */
    static int currentTrust(const Witness& witness, const PlayerState& state);

    /** @brief Secrets whose trigger holds at @p trust and that are not revealed yet, in definition order. */
    static std::vector<const WitnessSecret*> availableSecrets(const Witness& witness,
                                                              int trust,
                                                              const PlayerState& state);

    /** @brief First lie whose trust condition holds and whose topic the question mentions. */
    static std::optional<WitnessLie> shouldLie(const Witness& witness, const std::string& question, int trust);

    /**
     * @brief Detects "show the X", "present X", "give X" or "reveal X".
     *
     * @return The lowered word after the verb (and an optional "the").
     */
    static std::optional<std::string> detectEvidencePresentation(const std::string& input);
};

} // namespace casefile::domain::rules
