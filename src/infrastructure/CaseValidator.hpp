/**
 * @file CaseValidator.hpp
 * @brief Structural validation gate for case definition JSON.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace casefile::infrastructure {

/**
 * @class CaseValidator
 * @brief Checks a case document before it is parsed into a CaseDefinition.
 *
 * Errors refuse the case. Warnings are authoring lint; the case still loads.
 */
class CaseValidator {
public:
    struct Result {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        bool ok() const { return errors.empty(); }
    };

    /**
     * @brief Validate a case document.
     * @param caseJson Parsed case file.
     * @return Every error and warning found, in document order.
     */
    Result Validate(const nlohmann::json& caseJson) const;

private:
    void ValidateRequirement(const nlohmann::json& req,
                             const std::string& hypothesisId,
                             const std::vector<std::string>& evidenceIds,
                             int depth,
                             Result& result) const;
};

} // namespace casefile::infrastructure
