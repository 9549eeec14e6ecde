/**
 * @file MentorFeedbackService.hpp
 * @brief Turns engine results into display prose, with an optional generator.
 */

#pragma once

#include <memory>
#include <string>

#include "application/InvestigationService.hpp"
#include "domain/CaseDefinition.hpp"
#include "domain/NarrationService.hpp"
#include "domain/PlayerState.hpp"
#include "domain/Verdict.hpp"

namespace casefile::application {

/**
 * @class MentorFeedbackService
 * @brief Display text for verdicts, actions and witness answers.
 *
 * When a NarrationService is configured its text is preferred; any failure or
 * empty reply falls back to the deterministic templates. Neither path can
 * change a score, status or unlock.
 */
class MentorFeedbackService {
public:
    /** @param narration May be null; templates are used exclusively then. */
    explicit MentorFeedbackService(std::shared_ptr<domain::NarrationService> narration = nullptr);

    std::string verdictFeedback(const domain::CaseDefinition& caseDef,
                                const domain::PlayerState& state,
                                const domain::Accusation& accusation,
                                const domain::VerdictResult& result) const;

    std::string describeAction(const domain::CaseDefinition& caseDef,
                               const std::string& inputText,
                               const ActionOutcome& outcome) const;

    std::string describeInterrogation(const domain::CaseDefinition& caseDef,
                                      const std::string& question,
                                      const InterrogationOutcome& outcome) const;

    /** @brief Deterministic verdict text. Never names a culprit the result has not revealed. */
    static std::string TemplateVerdictFeedback(const domain::VerdictResult& result);

    static std::string TemplateActionText(const domain::CaseDefinition& caseDef, const ActionOutcome& outcome);

    static std::string TemplateInterrogationText(const domain::CaseDefinition& caseDef,
                                                 const InterrogationOutcome& outcome);

    /** @brief Opening line keyed on score and correctness. */
    static std::string Praise(const domain::VerdictResult& result);

private:
    std::shared_ptr<domain::NarrationService> m_narration;
};

} // namespace casefile::application
