/**
 * @file CaseRepository.hpp
 * @brief Interface for loading validated case definitions.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "CaseDefinition.hpp"

namespace casefile::domain {

/**
 * @class CaseRepository
 * @brief Source of immutable case definitions shared across sessions.
 */
class CaseRepository {
public:
    virtual ~CaseRepository() = default;

    /**
     * @brief Loads and validates one case.
     * @throws ValidationError when the case is missing or invalid.
     */
    virtual std::shared_ptr<const CaseDefinition> loadCase(const std::string& caseId) = 0;

    /** @brief Ids of every case that passes validation, sorted. */
    virtual std::vector<std::string> listCases() = 0;
};

} // namespace casefile::domain
