#include "infrastructure/OllamaClient.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>

namespace casefile::infrastructure {

using json = nlohmann::json;
using domain::ExternalServiceError;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;

json DeterministicOptions() {
    return {
        {"temperature", kDeterministicTemperature},
        {"top_p", kDeterministicTopP},
        {"seed", kDeterministicSeed}
    };
}

json PostJson(httplib::Client& cli, const std::string& path, const json& requestData) {
    auto res = cli.Post(path, requestData.dump(), "application/json");
    if (!res) {
        throw ExternalServiceError("Connection to Ollama failed (" + httplib::to_string(res.error()) + ")");
    }
    if (res->status != 200) {
        throw ExternalServiceError("Ollama returned HTTP " + std::to_string(res->status) + " for " + path);
    }
    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        throw ExternalServiceError(std::string("Ollama response is not JSON: ") + e.what());
    }
}
}

OllamaClient::OllamaClient(const std::string& host, int port, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds) {}

std::optional<std::string> OllamaClient::chat(const std::string& model, const nlohmann::json& messages) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeoutSeconds);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", DeterministicOptions()}
    };

    auto body = PostJson(cli, "/api/chat", requestData);
    if (body.contains("message") && body["message"].contains("content") &&
        body["message"]["content"].is_string()) {
        return body["message"]["content"].get<std::string>();
    }
    std::cerr << "[OllamaClient] /api/chat response has no message content." << std::endl;
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(2);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Could not parse model list: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace casefile::infrastructure
