#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <cassert>
#include "infrastructure/ConfigLoader.hpp"

using meetinglens::infrastructure::AppConfig;
using meetinglens::infrastructure::ConfigLoader;

namespace {

void TestPartialOverrides() {
    std::cout << "[Test] Partial settings keep defaults for missing keys..." << std::endl;
    std::string error;
    auto config = ConfigLoader::Parse(R"({
        "audio": {"window_seconds": 4.0, "input_file": "standup.wav"},
        "analysis": {"words_per_analysis": 80, "temperature": 0.5},
        "completion": {"provider": "openai", "model": "grok-3"},
        "session": {"max_duration_seconds": 600}
    })", error);
    assert(config.has_value());
    assert(config->pipeline.audio.windowSeconds == 4.0);
    assert(config->pipeline.audio.overlapSeconds == 1.5);
    assert(config->pipeline.audio.inputFile == "standup.wav");
    assert(config->pipeline.audio.sampleRate == 16000);
    assert(config->pipeline.analysis.wordsPerAnalysis == 80);
    assert(config->pipeline.analysis.wordsPerRollingSummary == 300);
    assert(config->pipeline.analysis.temperature > 0.49f && config->pipeline.analysis.temperature < 0.51f);
    assert(config->completion.provider == "openai");
    assert(config->completion.model == "grok-3");
    assert(config->completion.apiKeyEnv == "XAI_API_KEY");
    assert(config->pipeline.session.maxDurationSeconds == 600.0);
    assert(config->pipeline.session.joinTimeoutSeconds == 5.0);
    assert(config->pipeline.transcription.modelPath.find("ggml-base.bin") != std::string::npos);
    assert(config->pipeline.transcription.vad.enabled);
    assert(config->pipeline.transcription.vad.minSilenceMs == 500);
    std::cout << "[PASS] Partial settings keep defaults for missing keys" << std::endl;
}

void TestRejectsBadDocuments() {
    std::cout << "[Test] Bad settings documents are rejected..." << std::endl;
    std::string error;
    assert(!ConfigLoader::Parse("{ not json", error));
    assert(!error.empty());

    error.clear();
    assert(!ConfigLoader::Parse("[1, 2, 3]", error));
    assert(!error.empty());

    error.clear();
    assert(!ConfigLoader::Parse(R"({"audio": {"window_seconds": "long"}})", error));
    assert(!error.empty());
    std::cout << "[PASS] Bad settings documents are rejected" << std::endl;
}

void TestLoadFromFile() {
    std::cout << "[Test] Load reads an explicit file and falls back to defaults..." << std::endl;
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "meetinglens_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"transcription": {"language": "de", "beam_size": 1,
                                  "vad": {"enabled": false, "min_silence_ms": 800}}})";
    }
    AppConfig config = ConfigLoader::Load(path.string());
    assert(config.sourcePath == path.string());
    assert(config.pipeline.transcription.language == "de");
    assert(config.pipeline.transcription.beamSize == 1);
    assert(!config.pipeline.transcription.vad.enabled);
    assert(config.pipeline.transcription.vad.minSilenceMs == 800);
    assert(config.pipeline.transcription.vad.speechPadMs == 200);
    fs::remove(path);

    AppConfig missing = ConfigLoader::Load((fs::temp_directory_path() / "meetinglens_missing.json").string());
    assert(missing.sourcePath.empty());
    assert(missing.pipeline.transcription.language == "en");
    std::cout << "[PASS] Load reads an explicit file and falls back to defaults" << std::endl;
}

void TestApiKeyFromEnvironment() {
    std::cout << "[Test] API key comes from the named variable..." << std::endl;
    meetinglens::infrastructure::CompletionSettings settings;
    settings.apiKeyEnv = "MEETINGLENS_TEST_KEY";
    unsetenv("MEETINGLENS_TEST_KEY");
    assert(ConfigLoader::ResolveApiKey(settings).empty());
    setenv("MEETINGLENS_TEST_KEY", "secret-123", 1);
    assert(ConfigLoader::ResolveApiKey(settings) == "secret-123");
    unsetenv("MEETINGLENS_TEST_KEY");
    std::cout << "[PASS] API key comes from the named variable" << std::endl;
}

} // namespace

int main() {
    TestPartialOverrides();
    TestRejectsBadDocuments();
    TestLoadFromFile();
    TestApiKeyFromEnvironment();
    std::cout << "[Test] ConfigLoader: all tests passed." << std::endl;
    return 0;
}
