/**
 * @file MeetingLensApp.cpp
 * @brief Implementation of the MeetingLensApp class.
 */
#include "app/MeetingLensApp.hpp"

#include <SDL.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>
#include "application/SessionOrchestrator.hpp"
#include "domain/AnalysisResult.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/OpenAiCompatibleAdapter.hpp"
#include "infrastructure/SdlCaptureSource.hpp"
#include "infrastructure/WavFileSource.hpp"
#include "infrastructure/WhisperCppAdapter.hpp"

namespace meetinglens::app {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
    g_interrupted = 1;
}

void AppendSection(std::ostringstream& out, const char* title, const std::vector<std::string>& items) {
    if (items.empty()) return;
    out << "\n" << title << ":\n";
    for (const auto& item : items) {
        out << "  - " << item << "\n";
    }
}

std::shared_ptr<domain::CompletionService> MakeCompletionService(const infrastructure::CompletionSettings& settings) {
    if (settings.provider == "openai") {
        return std::make_shared<infrastructure::OpenAiCompatibleAdapter>(
            settings.baseUrl, infrastructure::ConfigLoader::ResolveApiKey(settings),
            settings.model, settings.timeoutSeconds);
    }
    if (settings.provider != "ollama") {
        std::cerr << "[MeetingLensApp] Unknown completion provider '" << settings.provider
                  << "'; using ollama." << std::endl;
    }
    return std::make_shared<infrastructure::OllamaAdapter>(
        settings.host, settings.port, settings.model, settings.timeoutSeconds);
}

} // namespace

std::string FormatAnalysis(const domain::AnalysisResult& result) {
    std::ostringstream out;
    out << (result.isFinal ? "=== FINAL MEETING REPORT ===" : "=== Meeting insights ===") << "\n";
    out << result.technicalAnalysis << "\n";
    AppendSection(out, "Potential issues", result.potentialIssues);
    AppendSection(out, "Recommendations", result.recommendations);
    AppendSection(out, "Questions to ask", result.clarifyingQuestions);
    AppendSection(out, "Action items", result.actionItems);
    AppendSection(out, "Key decisions", result.keyDecisions);
    return out.str();
}

MeetingLensApp::MeetingLensApp(std::string configPath)
    : m_configPath(std::move(configPath)) {}

MeetingLensApp::~MeetingLensApp() {
    Shutdown();
}

bool MeetingLensApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_configPath);
    const auto& pipeline = m_config.pipeline;

    if (SDL_Init(SDL_INIT_AUDIO) != 0) {
        std::cerr << "[MeetingLensApp] SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    m_sdlInitialized = true;

    // Dependency Injection / Composition Root
    std::shared_ptr<domain::AudioSource> source;
    if (!pipeline.audio.inputFile.empty()) {
        source = std::make_shared<infrastructure::WavFileSource>(
            pipeline.audio.inputFile, pipeline.audio.sampleRate, pipeline.audio.captureChunkSamples);
    } else {
        source = std::make_shared<infrastructure::SdlCaptureSource>(
            pipeline.audio.sampleRate, pipeline.audio.captureChunkSamples, pipeline.audio.device);
    }

    auto whisper = std::make_shared<infrastructure::WhisperCppAdapter>(
        pipeline.transcription.modelPath, pipeline.transcription.threads, pipeline.transcription.beamSize);
    std::string error;
    if (!whisper->preload(error)) {
        std::cerr << "[MeetingLensApp] " << error << std::endl;
        return false;
    }

    auto ai = MakeCompletionService(m_config.completion);
    ai->initialize();
    std::cout << "[MeetingLensApp] Analysis model: " << ai->getCurrentModel() << std::endl;

    try {
        m_orchestrator = std::make_unique<application::SessionOrchestrator>(source, whisper, ai, pipeline);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[MeetingLensApp] Invalid configuration: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void MeetingLensApp::Shutdown() {
    m_orchestrator.reset();
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

int MeetingLensApp::Run() {
    if (!Init()) {
        return 1;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto started = m_orchestrator->start();
    if (!started.ok()) {
        std::cerr << "[MeetingLensApp] " << started.message << std::endl;
        return 1;
    }
    std::cout << "Recording. Press Ctrl+C to stop and generate the final report." << std::endl;

    MonitorRecording();

    auto stopped = m_orchestrator->stop();
    std::cout << "[MeetingLensApp] " << stopped.message << std::endl;
    PrintSummary();

    if (stopped.code == application::OutcomeCode::CaptureFailed ||
        !m_orchestrator->lastError().empty()) {
        return 1;
    }
    return 0;
}

void MeetingLensApp::MonitorRecording() {
    const double maxDuration = m_config.pipeline.session.maxDurationSeconds;
    size_t shownPasses = 0;

    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto snapshot = m_orchestrator->sessionState();
        if (snapshot.state != domain::SessionState::Recording) {
            // Capture failed underneath us.
            break;
        }
        if (maxDuration > 0.0 && snapshot.durationSeconds >= maxDuration) {
            std::cout << "[MeetingLensApp] Reached the configured duration limit." << std::endl;
            break;
        }
        if (m_orchestrator->sourceExhausted()) {
            break;
        }

        if (snapshot.analysisPasses != shownPasses) {
            shownPasses = snapshot.analysisPasses;
            if (auto analysis = m_orchestrator->currentAnalysis()) {
                std::cout << "\n" << FormatAnalysis(*analysis) << std::endl;
            }
        }
    }
}

void MeetingLensApp::PrintSummary() const {
    if (auto report = m_orchestrator->finalReport()) {
        std::cout << "\n" << FormatAnalysis(*report) << std::endl;
    }

    auto snapshot = m_orchestrator->sessionState();
    std::cout << "=== Session statistics ===\n"
              << "Session:                " << snapshot.sessionId << "\n"
              << "Duration:               " << static_cast<int>(snapshot.durationSeconds) / 60 << "m "
              << static_cast<int>(snapshot.durationSeconds) % 60 << "s\n"
              << "Words transcribed:      " << snapshot.wordCount << "\n"
              << "Transcript segments:    " << snapshot.segmentCount << "\n"
              << "Rolling summaries:      " << snapshot.summaryCount << "\n"
              << "Analysis passes:        " << snapshot.analysisPasses << "\n"
              << "Issues identified:      " << snapshot.issuesIdentified << "\n"
              << "Recommendations given:  " << snapshot.recommendationsGiven << "\n"
              << "Windows transcribed:    " << snapshot.windowsTranscribed << "\n"
              << "Windows dropped:        " << snapshot.windowsDropped << "\n"
              << "Capture queue peak:     " << snapshot.queueHighWater << std::endl;
    if (!snapshot.lastError.empty()) {
        std::cout << "Last error:             " << snapshot.lastError << std::endl;
    }

    auto transcript = m_orchestrator->transcriptText();
    if (!transcript.empty()) {
        std::cout << "\n=== Transcript ===\n" << transcript << std::endl;
    }
}

} // namespace meetinglens::app
