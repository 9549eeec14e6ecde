/**
 * @file CasefileApp.hpp
 * @brief Console application for playing one case.
 */

#pragma once

#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace casefile::app {

/**
 * @class CasefileApp
 * @brief Orchestrates the application lifecycle: initialization, the command loop, and shutdown.
 */
class CasefileApp {
public:
    /**
     * @brief Parses arguments, wires services and runs the command loop.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads settings and builds the service graph.
     * @return True if the case could be opened.
     */
    bool Init();

    void Shutdown();

    /** @brief Handles one input line. @return false when the player quits. */
    bool HandleLine(const std::string& line);

    void PrintStatus();
    void PrintNotifications();
    void HandleAccuse(const std::string& args);
    void HandleInterrogation(const std::string& command, const std::string& args);
    void HandleSaves(const std::string& command, const std::string& args);

    static std::vector<std::string> SplitList(const std::string& text, char sep);
    static std::string Trim(const std::string& text);

    std::string m_caseId;
    std::string m_playerId = "player";
    std::string m_projectRoot = ".";
    infrastructure::Settings m_settings;
    application::AppServices m_services;
};

} // namespace casefile::app
