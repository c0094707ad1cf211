#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <cassert>
#include "application/SessionOrchestrator.hpp"

using namespace meetinglens;
using application::OutcomeCode;
using application::PipelineConfig;
using application::SessionOrchestrator;

namespace {

// Audio source driven by the test: emit() plays the role of the device callback.
class ManualSource : public domain::AudioSource {
public:
    bool start(ChunkSink sink, std::string& error) override {
        if (failStart) {
            error = "no capture device";
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sink = std::move(sink);
        healthy = true;
        ++starts;
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sink = nullptr;
    }

    bool isHealthy(std::string& error) const override {
        if (!healthy) {
            error = "device unplugged";
            return false;
        }
        return true;
    }

    int sampleRate() const override { return 16000; }

    // Each chunk carries its own number as the sample value.
    bool emit(int16_t id, size_t samples = 8000) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_sink) return false;
        m_sink(std::vector<int16_t>(samples, id));
        return true;
    }

    std::atomic<bool> failStart{false};
    std::atomic<bool> healthy{true};
    std::atomic<int> starts{0};

private:
    std::mutex m_mutex;
    ChunkSink m_sink;
};

// Recovers the chunk number and answers after a latency that varies per window.
class VariableLatencyTranscriber : public domain::TranscriptionService {
public:
    bool transcribe(const std::vector<float>& samples, int, const std::string&,
                    std::vector<domain::TranscribedSpan>& spans, std::string&) override {
        int id = static_cast<int>(std::lround(samples.front() * 32768.0f));
        std::this_thread::sleep_for(std::chrono::milliseconds(fixedLatencyMs > 0 ? fixedLatencyMs : (id * 7) % 13));
        ++calls;
        spans.push_back({" chunk" + std::to_string(id) + " alpha beta gamma delta ", 0, 500});
        return true;
    }

    std::atomic<int> calls{0};
    int fixedLatencyMs = 0;
};

class CountingCompletionService : public domain::CompletionService {
public:
    std::optional<std::string> complete(const domain::CompletionRequest& request) override {
        if (request.shape == domain::ResponseShape::FreeText) {
            return std::string("Summary of the conversation.");
        }
        if (request.systemInstruction.find("FINAL SUMMARY") != std::string::npos) {
            ++finalCalls;
            return std::string(R"({"technical_analysis": "Final overview", "action_items": ["Follow up"]})");
        }
        ++analysisCalls;
        if (analysisDelayMs > 0) {
            analysisStarted = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(analysisDelayMs.load()));
        }
        return std::string(R"({"technical_analysis": "Interim overview"})");
    }

    std::string getCurrentModel() const override { return "mock"; }

    std::atomic<int> finalCalls{0};
    std::atomic<int> analysisCalls{0};
    std::atomic<int> analysisDelayMs{0};
    std::atomic<bool> analysisStarted{false};
};

PipelineConfig FastConfig() {
    PipelineConfig config;
    config.audio.windowSeconds = 0.5;   // 8000 samples: one chunk per window
    config.audio.overlapSeconds = 0.0;
    config.audio.minFlushSeconds = 0.1;
    config.analysis.wordsPerAnalysis = 20;
    config.session.joinTimeoutSeconds = 5.0;
    config.transcription.vad.enabled = false; // chunk ids are far below the speech threshold
    return config;
}

struct Fixture {
    explicit Fixture(PipelineConfig config = FastConfig())
        : source(std::make_shared<ManualSource>()),
          stt(std::make_shared<VariableLatencyTranscriber>()),
          ai(std::make_shared<CountingCompletionService>()),
          orchestrator(source, stt, ai, config) {}

    std::shared_ptr<ManualSource> source;
    std::shared_ptr<VariableLatencyTranscriber> stt;
    std::shared_ptr<CountingCompletionService> ai;
    SessionOrchestrator orchestrator;
};

void TestStopWithoutSpeech() {
    std::cout << "[Test] Stop with no transcripts skips the final report..." << std::endl;
    Fixture f;
    assert(f.orchestrator.start().ok());
    assert(f.orchestrator.sessionState().state == domain::SessionState::Recording);

    auto outcome = f.orchestrator.stop();
    assert(outcome.code == OutcomeCode::NoSpeechCaptured);
    assert(outcome.message.find("No transcripts") != std::string::npos);
    assert(!f.orchestrator.finalReport());
    assert(f.ai->finalCalls == 0);
    assert(f.orchestrator.sessionState().state == domain::SessionState::Idle);
    std::cout << "[PASS] Stop with no transcripts skips the final report" << std::endl;
}

void TestUsageErrors() {
    std::cout << "[Test] Lifecycle misuse is rejected..." << std::endl;
    Fixture f;
    assert(f.orchestrator.stop().code == OutcomeCode::NotRecording);
    assert(f.orchestrator.start().ok());
    assert(f.orchestrator.start().code == OutcomeCode::AlreadyRecording);
    assert(f.source->starts == 1);
    f.orchestrator.stop();
    assert(f.orchestrator.stop().code == OutcomeCode::NotRecording);

    bool threw = false;
    PipelineConfig bad = FastConfig();
    bad.audio.overlapSeconds = bad.audio.windowSeconds;
    try {
        SessionOrchestrator invalid(f.source, f.stt, f.ai, bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    PipelineConfig mismatched = FastConfig();
    mismatched.audio.sampleRate = 8000;
    try {
        SessionOrchestrator invalid(f.source, f.stt, f.ai, mismatched);
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("16000 Hz") != std::string::npos;
    }
    assert(threw);
    std::cout << "[PASS] Lifecycle misuse is rejected" << std::endl;
}

void TestOrderedTranscriptAndIdempotentStop() {
    std::cout << "[Test] Transcript keeps chunk order; stop is idempotent..." << std::endl;
    Fixture f;
    assert(f.orchestrator.start().ok());

    const int kChunks = 24;
    for (int i = 0; i < kChunks; ++i) {
        assert(f.source->emit(static_cast<int16_t>(i + 1)));
        if (i % 4 == 0) std::this_thread::sleep_for(std::chrono::milliseconds(3));
    }

    auto outcome = f.orchestrator.stop();
    assert(outcome.ok());
    assert(f.stt->calls == kChunks);

    std::istringstream transcript(f.orchestrator.transcriptText());
    std::string word;
    int expected = 1;
    while (transcript >> word) {
        if (word.rfind("chunk", 0) == 0) {
            assert(word == "chunk" + std::to_string(expected));
            ++expected;
        }
    }
    assert(expected == kChunks + 1);

    auto snapshot = f.orchestrator.sessionState();
    assert(snapshot.state == domain::SessionState::Idle);
    assert(snapshot.segmentCount == static_cast<size_t>(kChunks));
    assert(snapshot.wordCount == kChunks * 5);
    assert(snapshot.windowsTranscribed == static_cast<uint64_t>(kChunks));
    assert(snapshot.analysisPasses >= 1);
    assert(snapshot.queueHighWater >= 1);

    auto report = f.orchestrator.finalReport();
    assert(report && report->isFinal);
    assert(report->technicalAnalysis == "Final overview");
    assert(f.ai->finalCalls == 1);
    assert(f.orchestrator.currentAnalysis()->technicalAnalysis == "Interim overview");

    auto again = f.orchestrator.stop();
    assert(again.code == OutcomeCode::NotRecording);
    assert(f.ai->finalCalls == 1);
    assert(f.orchestrator.finalReport()->technicalAnalysis == "Final overview");
    std::cout << "[PASS] Transcript keeps chunk order; stop is idempotent" << std::endl;
}

void TestNewSessionStartsFresh() {
    std::cout << "[Test] A new session starts with an empty ledger..." << std::endl;
    Fixture f;
    assert(f.orchestrator.start().ok());
    f.source->emit(1);
    f.orchestrator.stop();
    std::string firstId = f.orchestrator.sessionState().sessionId;
    assert(!f.orchestrator.transcriptText().empty());

    assert(f.orchestrator.start().ok());
    auto snapshot = f.orchestrator.sessionState();
    assert(snapshot.sessionId != firstId);
    assert(snapshot.segmentCount == 0);
    assert(!f.orchestrator.finalReport());
    f.orchestrator.stop();
    std::cout << "[PASS] A new session starts with an empty ledger" << std::endl;
}

void TestCaptureFailure() {
    std::cout << "[Test] Capture failure returns the session to idle..." << std::endl;
    Fixture f;
    f.source->failStart = true;
    auto refused = f.orchestrator.start();
    assert(refused.code == OutcomeCode::CaptureFailed);
    assert(f.orchestrator.sessionState().state == domain::SessionState::Idle);
    assert(f.orchestrator.lastError() == "no capture device");

    f.source->failStart = false;
    assert(f.orchestrator.start().ok());
    assert(f.orchestrator.lastError().empty());
    f.source->healthy = false;

    // The processing loop notices on its next idle poll.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (f.orchestrator.sessionState().state != domain::SessionState::Idle &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    auto snapshot = f.orchestrator.sessionState();
    assert(snapshot.state == domain::SessionState::Idle);
    assert(snapshot.lastError == "device unplugged");
    assert(!f.orchestrator.finalReport());
    assert(f.orchestrator.stop().code == OutcomeCode::NotRecording);

    // Recording can resume once the device is back.
    assert(f.orchestrator.start().ok());
    f.orchestrator.stop();
    std::cout << "[PASS] Capture failure returns the session to idle" << std::endl;
}

void TestStuckWorkerIsAbandoned() {
    std::cout << "[Test] Stop gives up on a stuck worker after the timeout..." << std::endl;
    PipelineConfig config = FastConfig();
    config.session.joinTimeoutSeconds = 0.2;
    Fixture f(config);
    f.stt->fixedLatencyMs = 1000;

    assert(f.orchestrator.start().ok());
    f.source->emit(1);
    f.source->emit(2);
    f.source->emit(3);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto begin = std::chrono::steady_clock::now();
    f.orchestrator.stop();
    auto took = std::chrono::steady_clock::now() - begin;
    assert(took < std::chrono::milliseconds(900));
    assert(f.orchestrator.sessionState().state == domain::SessionState::Idle);

    // The abandoned worker finishes its current window and transcribes nothing more.
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    assert(f.stt->calls == 1);
    std::cout << "[PASS] Stop gives up on a stuck worker after the timeout" << std::endl;
}

void TestStuckAnalysisDoesNotBlockStop() {
    std::cout << "[Test] Stop is bounded while an analysis call hangs..." << std::endl;
    PipelineConfig config = FastConfig();
    config.analysis.wordsPerAnalysis = 5;
    config.session.joinTimeoutSeconds = 0.2;
    Fixture f(config);
    f.ai->analysisDelayMs = 2000;

    assert(f.orchestrator.start().ok());
    f.source->emit(1); // one window, five words
    auto waitStart = std::chrono::steady_clock::now();
    while (!f.ai->analysisStarted && std::chrono::steady_clock::now() - waitStart < std::chrono::seconds(2)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(f.ai->analysisStarted);

    auto begin = std::chrono::steady_clock::now();
    auto outcome = f.orchestrator.stop();
    auto took = std::chrono::steady_clock::now() - begin;
    assert(took < std::chrono::milliseconds(1000));
    assert(outcome.ok());
    assert(outcome.message.find("final report failed") != std::string::npos);
    assert(f.orchestrator.sessionState().state == domain::SessionState::Idle);

    auto report = f.orchestrator.finalReport();
    assert(report && report->isError && report->isFinal);
    assert(f.ai->finalCalls == 0);

    // The hung reply arrives after the session closed and is dropped.
    std::this_thread::sleep_for(std::chrono::milliseconds(2500));
    assert(!f.orchestrator.currentAnalysis());
    assert(f.orchestrator.finalReport()->isError);
    std::cout << "[PASS] Stop is bounded while an analysis call hangs" << std::endl;
}

void TestSilentAudioCapturesNoSpeech() {
    std::cout << "[Test] Silent audio never reaches the recognizer..." << std::endl;
    PipelineConfig config = FastConfig();
    config.transcription.vad.enabled = true;
    Fixture f(config);

    assert(f.orchestrator.start().ok());
    for (int i = 0; i < 3; ++i) {
        assert(f.source->emit(0));
    }
    auto outcome = f.orchestrator.stop();
    assert(outcome.code == OutcomeCode::NoSpeechCaptured);
    assert(f.stt->calls == 0);
    assert(f.orchestrator.transcriptText().empty());
    assert(f.ai->finalCalls == 0);
    std::cout << "[PASS] Silent audio never reaches the recognizer" << std::endl;
}

} // namespace

int main() {
    TestStopWithoutSpeech();
    TestUsageErrors();
    TestOrderedTranscriptAndIdempotentStop();
    TestNewSessionStartsFresh();
    TestCaptureFailure();
    TestStuckWorkerIsAbandoned();
    TestStuckAnalysisDoesNotBlockStop();
    TestSilentAudioCapturesNoSpeech();
    std::cout << "[Test] SessionOrchestrator: all tests passed." << std::endl;
    return 0;
}
