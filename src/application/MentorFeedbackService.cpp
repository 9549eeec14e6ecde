/**
 * @file MentorFeedbackService.cpp
 * @brief Implementation of MentorFeedbackService.
 */

#include "application/MentorFeedbackService.hpp"
#include "application/NarratorContextBuilder.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <iostream>
#include <sstream>

namespace casefile::application {

using namespace casefile::domain;
using casefile::domain::rules::MatchOutcome;
using casefile::infrastructure::NarrationRole;
using casefile::infrastructure::PromptCatalog;

MentorFeedbackService::MentorFeedbackService(std::shared_ptr<NarrationService> narration)
    : m_narration(std::move(narration)) {}

std::string MentorFeedbackService::Praise(const VerdictResult& result) {
    if (result.score >= 90) return "Outstanding. This is what I expect from a competent investigator.";
    if (result.score >= 75) return "Good work. You cited relevant evidence and reasoned clearly.";
    if (result.score >= 60) return "Adequate. You got there, but barely.";
    if (result.correct && result.fallacies.empty()) return "Correct, but I've seen better reasoning from first-years.";
    if (result.correct) return "Right answer, wrong path. Don't rely on luck.";
    return "Try harder.";
}

std::string MentorFeedbackService::TemplateVerdictFeedback(const VerdictResult& result) {
    if (!result.accepted) {
        return result.rejectionReason;
    }

    std::ostringstream out;
    out << Praise(result) << "\n";
    out << result.feedback << "\n";
    if (!result.whyWrong.empty()) {
        out << "Why: " << result.whyWrong << "\n";
    }
    out << "Score: " << result.score << "/100 (" << result.quality << ")\n";

    if (!result.fallacies.empty()) {
        out << "Reasoning flaws:\n";
        for (const auto& f : result.fallacies) {
            out << "  - " << FallacyToString(f.kind);
            if (!f.example.empty()) out << ": " << f.example;
            out << "\n";
        }
    }
    if (!result.missingEvidence.empty()) {
        out << "Key evidence you did not cite: " << result.missingEvidence.size() << " item(s).\n";
    }
    if (!result.hint.empty()) {
        out << "Hint: " << result.hint << "\n";
    }
    out << "Attempts remaining: " << result.attemptsRemaining;
    return out.str();
}

std::string MentorFeedbackService::TemplateActionText(const CaseDefinition& caseDef, const ActionOutcome& outcome) {
    std::ostringstream out;
    const auto& match = outcome.match;

    switch (match.outcome) {
        case MatchOutcome::Discovered:
            if (const Evidence* e = caseDef.findEvidence(match.evidenceId)) {
                out << "You find: " << e->name << ". " << e->description;
            }
            break;
        case MatchOutcome::AlreadyExamined:
            if (const Evidence* e = caseDef.findEvidence(match.evidenceId)) {
                out << "You have already examined the " << e->name << ".";
            }
            break;
        case MatchOutcome::NotPresent:
            out << match.response;
            break;
        case MatchOutcome::Moved:
            if (const Location* loc = caseDef.findLocation(match.locationId)) {
                out << "You go to " << loc->name << ". " << loc->description;
            }
            break;
        case MatchOutcome::NoDiscovery:
            out << "You search, but find nothing of note.";
            break;
    }

    for (const auto& evt : outcome.unlocks) {
        const Hypothesis* h = caseDef.findHypothesis(evt.hypothesisId);
        out << "\nNew hypothesis available: " << (h ? h->label : evt.hypothesisId);
    }
    for (const auto& id : outcome.newContradictionIds) {
        for (const auto& c : caseDef.contradictions) {
            if (c.id == id) out << "\nContradiction noticed: " << c.description;
        }
    }
    return out.str();
}

std::string MentorFeedbackService::TemplateInterrogationText(const CaseDefinition& caseDef,
                                                             const InterrogationOutcome& outcome) {
    const Witness* w = caseDef.findWitness(outcome.witnessId);
    if (!outcome.witnessKnown || !w) {
        return "Nobody here answers to '" + outcome.witnessId + "'.";
    }

    std::ostringstream out;
    if (!outcome.presentedEvidenceId.empty()) {
        const Evidence* e = caseDef.findEvidence(outcome.presentedEvidenceId);
        out << "You show " << w->name << " the " << (e ? e->name : outcome.presentedEvidenceId) << ".";
    }
    if (outcome.lie) {
        if (out.tellp() > 0) out << "\n";
        out << w->name << ": \"" << outcome.lie->response << "\"";
    }
    for (const auto& id : outcome.revealedSecretIds) {
        if (const WitnessSecret* secret = w->findSecret(id)) {
            if (out.tellp() > 0) out << "\n";
            out << w->name << ": \"" << secret->text << "\"";
        }
    }
    if (out.tellp() == 0) {
        out << w->name << " has nothing new to tell you.";
    }
    if (outcome.trustDelta > 0) {
        out << "\n" << w->name << " seems to trust you a little more.";
    } else if (outcome.trustDelta < 0) {
        out << "\n" << w->name << " bristles at your tone.";
    }
    return out.str();
}

std::string MentorFeedbackService::verdictFeedback(const CaseDefinition& caseDef,
                                                   const PlayerState& state,
                                                   const Accusation& accusation,
                                                   const VerdictResult& result) const {
    if (m_narration && result.accepted) {
        try {
            auto context = NarratorContextBuilder::buildVerdictContext(caseDef, state, accusation, result);
            auto text = m_narration->narrate(PromptCatalog::GetSystemPrompt(NarrationRole::Mentor), context);
            if (text) return *text;
            std::cerr << "[MentorFeedback] Empty narration; using template feedback." << std::endl;
        } catch (const ExternalServiceError& e) {
            std::cerr << "[MentorFeedback] Narration failed: " << e.what() << "; using template feedback." << std::endl;
        }
    }
    return TemplateVerdictFeedback(result);
}

std::string MentorFeedbackService::describeAction(const CaseDefinition& caseDef,
                                                  const std::string& inputText,
                                                  const ActionOutcome& outcome) const {
    if (m_narration) {
        try {
            auto context = NarratorContextBuilder::buildActionContext(caseDef, inputText, outcome);
            auto text = m_narration->narrate(PromptCatalog::GetSystemPrompt(NarrationRole::Narrator), context);
            if (text) return *text;
        } catch (const ExternalServiceError& e) {
            std::cerr << "[MentorFeedback] Narration failed: " << e.what() << std::endl;
        }
    }
    return TemplateActionText(caseDef, outcome);
}

std::string MentorFeedbackService::describeInterrogation(const CaseDefinition& caseDef,
                                                         const std::string& question,
                                                         const InterrogationOutcome& outcome) const {
    if (m_narration && outcome.witnessKnown) {
        try {
            auto context = NarratorContextBuilder::buildInterrogationContext(caseDef, question, outcome);
            auto text = m_narration->narrate(PromptCatalog::GetSystemPrompt(NarrationRole::Witness), context);
            if (text) return *text;
        } catch (const ExternalServiceError& e) {
            std::cerr << "[MentorFeedback] Narration failed: " << e.what() << std::endl;
        }
    }
    return TemplateInterrogationText(caseDef, outcome);
}

} // namespace casefile::application
