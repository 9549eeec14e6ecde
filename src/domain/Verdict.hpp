/**
 * @file Verdict.hpp
 * @brief Accusations, verdict attempts and evaluation results.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace casefile::domain {

/**
 * @enum FallacyKind
 * @brief Reasoning defects the fallacy detector can flag.
 */
enum class FallacyKind {
    ConfirmationBias,
    CorrelationNotCausation,
    AppealToAuthority,
    PostHoc,
    WeakReasoning
};

inline std::string FallacyToString(FallacyKind kind) {
    switch (kind) {
        case FallacyKind::ConfirmationBias: return "confirmation_bias";
        case FallacyKind::CorrelationNotCausation: return "correlation_not_causation";
        case FallacyKind::AppealToAuthority: return "appeal_to_authority";
        case FallacyKind::PostHoc: return "post_hoc";
        case FallacyKind::WeakReasoning: return "weak_reasoning";
    }
    return "weak_reasoning";
}

inline std::optional<FallacyKind> FallacyFromString(const std::string& key) {
    if (key == "confirmation_bias") return FallacyKind::ConfirmationBias;
    if (key == "correlation_not_causation") return FallacyKind::CorrelationNotCausation;
    if (key == "appeal_to_authority" || key == "authority_bias") return FallacyKind::AppealToAuthority;
    if (key == "post_hoc") return FallacyKind::PostHoc;
    if (key == "weak_reasoning") return FallacyKind::WeakReasoning;
    return std::nullopt;
}

/**
 * @enum FeedbackTone
 * @brief Hint specificity, chosen from attempts remaining only.
 */
enum class FeedbackTone {
    Vague,    ///< 7 or more attempts left.
    Specific, ///< 4 to 6 attempts left.
    Direct    ///< 3 or fewer attempts left.
};

inline std::string ToneToString(FeedbackTone tone) {
    switch (tone) {
        case FeedbackTone::Vague: return "vague";
        case FeedbackTone::Specific: return "specific";
        case FeedbackTone::Direct: return "direct";
    }
    return "vague";
}

enum class CaseStatus {
    Active,
    Solved,
    FailedSolvedByMentor
};

inline std::string CaseStatusToString(CaseStatus status) {
    switch (status) {
        case CaseStatus::Active: return "active";
        case CaseStatus::Solved: return "solved";
        case CaseStatus::FailedSolvedByMentor: return "failed_solved_by_mentor";
    }
    return "active";
}

inline CaseStatus CaseStatusFromString(const std::string& value) {
    if (value == "solved") return CaseStatus::Solved;
    if (value == "failed_solved_by_mentor") return CaseStatus::FailedSolvedByMentor;
    return CaseStatus::Active;
}

/**
 * @struct Accusation
 * @brief What the player submits as a final verdict.
 */
struct Accusation {
    std::string accusedId;
    std::string reasoning;
    std::vector<std::string> citedEvidenceIds;
};

/**
 * @struct VerdictAttempt
 * @brief Append-only history entry for one submission.
 */
struct VerdictAttempt {
    std::string accusedId;
    std::string reasoning;
    std::vector<std::string> citedEvidenceIds;
    bool correct = false;
    int score = 0;
    std::vector<FallacyKind> fallacies;
    std::chrono::system_clock::time_point timestamp;
};

struct DetectedFallacy {
    FallacyKind kind;
    std::string example; ///< Case-specific example text, empty when the case has none.

    bool operator==(const DetectedFallacy& other) const {
        return kind == other.kind && example == other.example;
    }
};

/**
 * @struct VerdictResult
 * @brief Everything the rubric decided about one accusation.
 */
struct VerdictResult {
    bool accepted = true;        ///< False when the accusation failed the input guard.
    std::string rejectionReason;

    bool correct = false;
    int score = 0;
    std::string quality;
    std::vector<DetectedFallacy> fallacies;
    std::vector<std::string> missingEvidence; ///< Key evidence ids not cited.

    std::string feedback;     ///< Mistake explanation, generic message or success message.
    std::string whyWrong;     ///< Filled from the common-mistake table when it matches.
    FeedbackTone tone = FeedbackTone::Vague;
    std::string hint;         ///< Tone-dependent hint; empty for correct accusations.

    int attemptsRemaining = 0;
    CaseStatus caseStatus = CaseStatus::Active;
    std::optional<std::string> revealedCulprit;

    bool operator==(const VerdictResult& other) const {
        return accepted == other.accepted && rejectionReason == other.rejectionReason &&
               correct == other.correct && score == other.score && quality == other.quality &&
               fallacies == other.fallacies && missingEvidence == other.missingEvidence &&
               feedback == other.feedback && whyWrong == other.whyWrong && tone == other.tone &&
               hint == other.hint && attemptsRemaining == other.attemptsRemaining &&
               caseStatus == other.caseStatus && revealedCulprit == other.revealedCulprit;
    }
};

} // namespace casefile::domain
