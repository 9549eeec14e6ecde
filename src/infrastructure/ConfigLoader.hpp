/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; the rest of the code base
 * only sees the typed Settings struct.
 */

#pragma once

#include <string>

namespace casefile::infrastructure {

/**
 * @struct NarrationSettings
 * @brief Connection details for the optional text-generation service.
 */
struct NarrationSettings {
    bool enabled = false;
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    int timeoutSeconds = 30;
};

struct Settings {
    std::string casesDir = "cases";
    std::string savesDir; ///< Empty means PathUtils::GetSavesDir().
    int maxAttempts = 10;
    int defaultInvestigationPoints = 12;
    NarrationSettings narration;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the given directory.
     *
     * A missing file yields defaults. Keys that are missing or have the wrong
     * type keep their defaults and produce a warning.
     */
    static Settings Load(const std::string& projectRoot);

    /**
     * @brief Writes settings.json, preserving unknown keys already in the file.
     */
    static void Save(const std::string& projectRoot, const Settings& settings);
};

} // namespace casefile::infrastructure
