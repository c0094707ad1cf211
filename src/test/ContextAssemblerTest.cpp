#include <iostream>
#include <string>
#include <cassert>
#include "application/ContextAssembler.hpp"
#include "application/FindingHistory.hpp"
#include "application/PipelineConfig.hpp"
#include "domain/RollingSummary.hpp"
#include "domain/Transcript.hpp"

using namespace meetinglens;
using application::AnalysisSettings;
using application::ContextAssembler;
using application::FindingHistory;

namespace {

void TestLastWords() {
    std::cout << "[Test] Final transcript keeps the most recent words..." << std::endl;
    bool truncated = true;
    assert(ContextAssembler::LastWords("a b c", 10, truncated) == "a b c");
    assert(!truncated);

    assert(ContextAssembler::LastWords("one two three four five", 2, truncated) == "four five");
    assert(truncated);

    assert(ContextAssembler::LastWords("  spaced \t out\nwords ", 3, truncated) == "spaced out words");
    assert(!truncated);
    std::cout << "[PASS] Final transcript keeps the most recent words" << std::endl;
}

struct Fixture {
    Fixture() : issues(10), recommendations(10), summaries(1000),
                assembler(ledger, summaries, issues, recommendations, settings) {}

    AnalysisSettings settings;
    domain::TranscriptLedger ledger;
    FindingHistory issues;
    FindingHistory recommendations;
    domain::RollingSummaryStore summaries;
    ContextAssembler assembler;
};

void TestAnalysisContextIsBounded() {
    std::cout << "[Test] Analysis context carries only recent segments and findings..." << std::endl;
    Fixture f;
    for (int i = 1; i <= 6; ++i) {
        f.ledger.append("segment" + std::to_string(i));
    }
    for (int i = 1; i <= 7; ++i) {
        f.issues.record({"issue" + std::to_string(i)});
    }
    f.summaries.add("Team agreed on a queue-based design.");

    auto bundle = f.assembler.assembleAnalysis(4, 123);
    assert(bundle.recentSegments.size() == 3);
    assert(bundle.recentSegments.front() == "segment4");
    assert(bundle.previousIssues.size() == 5);
    assert(bundle.previousIssues.front() == "issue3");
    assert(bundle.previousRecommendations.empty());
    assert(bundle.summaries.size() == 1);

    std::string text = bundle.render();
    assert(text.find("- Duration: 4 minutes") != std::string::npos);
    assert(text.find("- Total words: 123") != std::string::npos);
    assert(text.find("PREVIOUSLY IDENTIFIED ISSUES") != std::string::npos);
    assert(text.find("PREVIOUS RECOMMENDATIONS") == std::string::npos);
    assert(text.find("segment4 segment5 segment6") != std::string::npos);
    assert(text.find("segment3") == std::string::npos);
    std::cout << "[PASS] Analysis context carries only recent segments and findings" << std::endl;
}

void TestCompressionInput() {
    std::cout << "[Test] Compression reads the newest segments..." << std::endl;
    Fixture f;
    for (int i = 1; i <= 7; ++i) {
        f.ledger.append("part" + std::to_string(i));
    }
    assert(f.assembler.assembleCompressionInput() == "part3 part4 part5 part6 part7");
    std::cout << "[PASS] Compression reads the newest segments" << std::endl;
}

void TestFinalContextCapsTranscript() {
    std::cout << "[Test] Final context caps the transcript..." << std::endl;
    Fixture f;
    f.settings.finalTranscriptWordCap = 4;
    f.ledger.append("one two three");
    f.ledger.append("four five six");

    auto bundle = f.assembler.assembleFinal(10, 6);
    assert(bundle.transcriptTruncated);
    assert(bundle.transcript == "three four five six");
    assert(bundle.render().find("RECENT TRANSCRIPT (LAST 4 WORDS)") != std::string::npos);

    f.settings.finalTranscriptWordCap = 100;
    auto full = f.assembler.assembleFinal(10, 6);
    assert(!full.transcriptTruncated);
    assert(full.render().find("FULL TRANSCRIPT") != std::string::npos);
    std::cout << "[PASS] Final context caps the transcript" << std::endl;
}

} // namespace

int main() {
    TestLastWords();
    TestAnalysisContextIsBounded();
    TestCompressionInput();
    TestFinalContextCapsTranscript();
    std::cout << "[Test] ContextAssembler: all tests passed." << std::endl;
    return 0;
}
