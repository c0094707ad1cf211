/**
 * @file MeetingLensApp.hpp
 * @brief Terminal front end for MeetingLens.
 */

#pragma once

#include <memory>
#include <string>
#include "infrastructure/ConfigLoader.hpp"

namespace meetinglens::application {
class SessionOrchestrator;
}

namespace meetinglens::domain {
struct AnalysisResult;
}

namespace meetinglens::app {

/**
 * @class MeetingLensApp
 * @brief Wires the adapters into a SessionOrchestrator and runs one recording.
 *
 * Records until Ctrl+C, the configured maximum duration, or the end of the
 * input file, printing interim insights as they arrive, then prints the final
 * report, statistics and transcript.
 */
class MeetingLensApp {
public:
    explicit MeetingLensApp(std::string configPath = "");
    ~MeetingLensApp();

    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Loads configuration and builds the adapters.
     * @return True if initialization succeeded.
     */
    bool Init();

    void Shutdown();

    /** @brief Blocks until a stop condition is reached, printing new analyses. */
    void MonitorRecording();
    void PrintSummary() const;

    std::string m_configPath;
    infrastructure::AppConfig m_config;
    std::unique_ptr<application::SessionOrchestrator> m_orchestrator;
    bool m_sdlInitialized = false;
};

/** @brief Renders an analysis the way the terminal shows it. */
std::string FormatAnalysis(const domain::AnalysisResult& result);

} // namespace meetinglens::app
