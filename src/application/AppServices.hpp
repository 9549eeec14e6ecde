/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/MentorFeedbackService.hpp"
#include "application/SessionManager.hpp"
#include "domain/CaseRepository.hpp"
#include "domain/NarrationService.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SnapshotStore.hpp"

namespace casefile::application {

struct AppServices {
    std::shared_ptr<domain::CaseRepository> caseRepository;
    std::shared_ptr<domain::NarrationService> narration; ///< Null when narration is disabled.
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<infrastructure::SnapshotStore> snapshotStore;
    std::unique_ptr<SessionManager> sessionManager;
    std::unique_ptr<MentorFeedbackService> feedbackService;
};

} // namespace casefile::application
