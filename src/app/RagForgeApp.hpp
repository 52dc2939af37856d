/**
 * @file RagForgeApp.hpp
 * @brief Main application class for RagForge.
 */

#pragma once

#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace ragforge::app {

/** @brief Parsed command line. */
struct CommandLine {
    std::string configPath;             ///< Empty selects the XDG default.
    std::vector<std::string> startIds;
    bool startAll = false;
    bool listOnly = false;
    bool showHelp = false;
};

/**
 * @class RagForgeApp
 * @brief Orchestrates the application lifecycle: configuration, service wiring,
 *        the console chat loop and shutdown.
 */
class RagForgeApp {
public:
    /**
     * @brief Starts the application.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

    /** @throws std::invalid_argument on unknown or incomplete options. */
    static CommandLine ParseCommandLine(const std::vector<std::string>& args);

    static std::string Usage();

private:
    /** @brief Loads settings and builds every service. */
    bool Init(const CommandLine& cmd);

    void ListKnowledgeBases() const;
    void StartRequested(const CommandLine& cmd);
    void ConsoleLoop();

    /** @return false when the loop should end. */
    bool HandleCommand(const std::string& line);
    void Chat(const std::string& text);

    void Shutdown();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace ragforge::app
