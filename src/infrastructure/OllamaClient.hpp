/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace casefile::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 30);

    /**
     * @brief Sends a POST request to /api/chat.
     * @throws domain::ExternalServiceError on connection or HTTP failure.
     */
    std::optional<std::string> chat(const std::string& model, const nlohmann::json& messages);

    /** @brief Fetches available models from /api/tags. Empty when unreachable. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace casefile::infrastructure
