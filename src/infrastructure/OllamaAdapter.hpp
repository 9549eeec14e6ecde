/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include "domain/NarrationService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace casefile::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements NarrationService using the Ollama chat endpoint.
 */
class OllamaAdapter : public domain::NarrationService {
public:
    /**
     * @brief Constructor for OllamaAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Preferred model; replaced by detection if it is not installed.
     * @param timeoutSeconds Read timeout per request.
     */
    OllamaAdapter(const std::string& host = "localhost",
                  int port = 11434,
                  const std::string& model = "qwen2.5:7b",
                  int timeoutSeconds = 30);

    /** @brief Picks an installed model. Never throws; keeps the default when the server is down. */
    void initialize() override;

    /** @see domain::NarrationService::narrate */
    std::optional<std::string> narrate(const std::string& systemPrompt,
                                       const nlohmann::json& context) override;

    std::string getCurrentModel() const override { return m_model; }

private:
    void detectBestModel();

    OllamaClient m_client;
    std::string m_model; ///< Target model name.
};

} // namespace casefile::infrastructure
