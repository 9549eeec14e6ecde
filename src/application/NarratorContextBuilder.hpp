/**
 * @file NarratorContextBuilder.hpp
 * @brief Assembles structured context for the text-generation collaborator.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "application/InvestigationService.hpp"
#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"
#include "domain/Verdict.hpp"

namespace casefile::application {

/**
 * @class NarratorContextBuilder
 * @brief Gathers engine output into labeled JSON blocks.
 *
 * The generator receives these blocks verbatim; nothing it returns is fed
 * back into the engine. Verdict context never names the culprit unless the
 * result already revealed it.
 */
class NarratorContextBuilder {
public:
    static nlohmann::json buildActionContext(const domain::CaseDefinition& caseDef,
                                             const std::string& inputText,
                                             const ActionOutcome& outcome);

    static nlohmann::json buildVerdictContext(const domain::CaseDefinition& caseDef,
                                              const domain::PlayerState& state,
                                              const domain::Accusation& accusation,
                                              const domain::VerdictResult& result);

    /**
     * @brief The witness's answer as the engine decided it.
     *
     * Carries the lie response or the revealed secret texts. Secrets still
     * hidden are never included.
     */
    static nlohmann::json buildInterrogationContext(const domain::CaseDefinition& caseDef,
                                                    const std::string& question,
                                                    const InterrogationOutcome& outcome);

    /** @brief Discovered evidence names, witness trust counters and contradiction progress. */
    static nlohmann::json buildInvestigationBlock(const domain::CaseDefinition& caseDef,
                                                  const domain::PlayerState& state);
};

} // namespace casefile::application
