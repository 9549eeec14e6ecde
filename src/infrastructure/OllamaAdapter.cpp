/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "domain/rules/TextMatching.hpp"
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace casefile::infrastructure {

OllamaAdapter::OllamaAdapter(const std::string& host, int port, const std::string& model, int timeoutSeconds)
    : m_client(host, port, timeoutSeconds), m_model(model) {}

void OllamaAdapter::initialize() {
    detectBestModel();
}

void OllamaAdapter::detectBestModel() {
    const auto availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Keeping default: " << m_model << std::endl;
        return;
    }

    for (const auto& model : availableModels) {
        if (model == m_model) return;
    }

    // Priority Hierarchy
    const std::vector<std::string> priorities = {
        "qwen2.5:7b",
        "qwen2.5",
        "llama3",
        "mistral",
        "gemma"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                m_model = model;
                std::cout << "[OllamaAdapter] Auto-selected model: " << m_model << std::endl;
                return;
            }
        }
    }

    // Fallback: Pick the first available
    m_model = availableModels[0];
    std::cout << "[OllamaAdapter] Fallback model: " << m_model << std::endl;
}

std::optional<std::string> OllamaAdapter::narrate(const std::string& systemPrompt, const nlohmann::json& context) {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", systemPrompt}});
    messages.push_back({{"role", "user"}, {"content", context.dump(2)}});

    auto reply = m_client.chat(m_model, messages);
    if (!reply) return std::nullopt;

    std::string text = domain::rules::Trim(*reply);
    if (text.empty()) return std::nullopt;
    return text;
}

} // namespace casefile::infrastructure
