/**
 * @file NarrationService.hpp
 * @brief Interface for the text-generation collaborator.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace casefile::domain {

/**
 * @class NarrationService
 * @brief Turns structured engine context into display prose.
 *
 * The engine never parses the returned text for state changes.
 */
class NarrationService {
public:
    virtual ~NarrationService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Generates display text.
     * @param systemPrompt Persona and output rules.
     * @param context Structured, engine-produced context (opaque to the generator's caller).
     * @return Generated text, or nullopt when the service produced nothing usable.
     * @throws ExternalServiceError when the service is unreachable or fails.
     */
    virtual std::optional<std::string> narrate(const std::string& systemPrompt,
                                               const nlohmann::json& context) = 0;

    /** @brief Name of the model in use, for logging. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace casefile::domain
