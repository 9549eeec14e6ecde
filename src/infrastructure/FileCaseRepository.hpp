/**
 * @file FileCaseRepository.hpp
 * @brief Filesystem-based implementation of the CaseRepository.
 */

#pragma once
#include "domain/CaseRepository.hpp"
#include "infrastructure/CaseValidator.hpp"
#include <map>
#include <mutex>
#include <string>

namespace casefile::infrastructure {

/**
 * @class FileCaseRepository
 * @brief Loads `<casesDir>/<caseId>.json`, validates it and caches the result.
 */
class FileCaseRepository : public domain::CaseRepository {
public:
    /**
     * @param casesDir Directory holding one JSON file per case.
     * @param defaultInvestigationPoints Budget for cases that do not set one.
     */
    FileCaseRepository(const std::string& casesDir, int defaultInvestigationPoints = 12);

    /** @see domain::CaseRepository::loadCase */
    std::shared_ptr<const domain::CaseDefinition> loadCase(const std::string& caseId) override;

    /** @see domain::CaseRepository::listCases */
    std::vector<std::string> listCases() override;

private:
    std::shared_ptr<const domain::CaseDefinition> loadFromDisk(const std::string& caseId) const;

    std::string m_casesDir; ///< Path to the cases directory.
    int m_defaultInvestigationPoints;
    CaseValidator m_validator;

    std::mutex m_cacheMutex;
    std::map<std::string, std::shared_ptr<const domain::CaseDefinition>> m_cache;
};

} // namespace casefile::infrastructure
