/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace casefile::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

Settings ConfigLoader::Load(const std::string& projectRoot) {
    Settings settings;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        std::cerr << "[ConfigLoader] No settings.json at " << configPath.string() << "; using defaults." << std::endl;
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        ReadKey(j, "cases_dir", settings.casesDir);
        ReadKey(j, "saves_dir", settings.savesDir);
        ReadKey(j, "max_attempts", settings.maxAttempts);
        ReadKey(j, "default_investigation_points", settings.defaultInvestigationPoints);

        if (j.contains("narration") && j["narration"].is_object()) {
            const auto& n = j["narration"];
            ReadKey(n, "enabled", settings.narration.enabled);
            ReadKey(n, "host", settings.narration.host);
            ReadKey(n, "port", settings.narration.port);
            ReadKey(n, "model", settings.narration.model);
            ReadKey(n, "timeout_seconds", settings.narration.timeoutSeconds);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return Settings{};
    }

    if (settings.maxAttempts < 1) {
        std::cerr << "[ConfigLoader] max_attempts must be positive; using 10." << std::endl;
        settings.maxAttempts = 10;
    }
    if (settings.defaultInvestigationPoints < 0) {
        std::cerr << "[ConfigLoader] default_investigation_points must not be negative; using 12." << std::endl;
        settings.defaultInvestigationPoints = 12;
    }

    return settings;
}

void ConfigLoader::Save(const std::string& projectRoot, const Settings& settings) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve keys this version does not know about.
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json unreadable, rewriting: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["cases_dir"] = settings.casesDir;
    if (!settings.savesDir.empty()) j["saves_dir"] = settings.savesDir;
    j["max_attempts"] = settings.maxAttempts;
    j["default_investigation_points"] = settings.defaultInvestigationPoints;
    j["narration"] = {
        {"enabled", settings.narration.enabled},
        {"host", settings.narration.host},
        {"port", settings.narration.port},
        {"model", settings.narration.model},
        {"timeout_seconds", settings.narration.timeoutSeconds}
    };

    try {
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
}

} // namespace casefile::infrastructure
