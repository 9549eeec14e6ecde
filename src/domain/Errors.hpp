/**
 * @file Errors.hpp
 * @brief Exceptions surfaced to callers of the investigation engine.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace casefile::domain {

/**
 * @class ValidationError
 * @brief A case definition was refused at load time.
 */
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& caseId, std::vector<std::string> errors)
        : std::runtime_error(BuildMessage(caseId, errors)),
          m_caseId(caseId),
          m_errors(std::move(errors)) {}

    const std::string& caseId() const { return m_caseId; }

    /** @brief Every blocking problem found, in discovery order. */
    const std::vector<std::string>& errors() const { return m_errors; }

private:
    static std::string BuildMessage(const std::string& caseId, const std::vector<std::string>& errors) {
        std::string msg = "Case '" + caseId + "' failed validation";
        if (errors.empty()) return msg + ".";
        msg += ": " + errors.front();
        if (errors.size() > 1) {
            msg += " (+" + std::to_string(errors.size() - 1) + " more)";
        }
        return msg;
    }

    std::string m_caseId;
    std::vector<std::string> m_errors;
};

/**
 * @class PersistenceError
 * @brief Saving or loading a snapshot failed. In-memory state is untouched.
 */
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ExternalServiceError
 * @brief The text-generation collaborator failed or timed out.
 */
class ExternalServiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace casefile::domain
