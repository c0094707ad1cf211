#include <iostream>
#include <stdexcept>
#include <vector>
#include <cassert>
#include <cmath>
#include "application/WindowAssembler.hpp"

using meetinglens::application::WindowAssembler;
using meetinglens::domain::AudioChunk;

namespace {

AudioChunk MakeChunk(uint64_t sequence, size_t samples, int16_t value) {
    AudioChunk chunk;
    chunk.sequence = sequence;
    chunk.samples.assign(samples, value);
    return chunk;
}

void TestThresholdAndOverlap() {
    std::cout << "[Test] Window threshold and overlap carry-over..." << std::endl;
    // 3 s window, 1.5 s overlap at 16 kHz: 48000 / 24000 samples.
    WindowAssembler assembler(16000, 3.0, 1.5, 1.0);

    for (uint64_t i = 0; i < 5; ++i) {
        assert(!assembler.append(MakeChunk(i, 8192, 1000)));
    }
    assert(assembler.bufferedSamples() == 5 * 8192);

    auto window = assembler.append(MakeChunk(5, 8192, -1000));
    assert(window.has_value());
    assert(window->index == 0);
    assert(window->samples.size() == 6 * 8192);
    assert(window->firstChunk == 0);
    assert(window->lastChunk == 5);
    assert(window->sampleRate == 16000);
    assert(std::fabs(window->samples.front() - 1000.0f / 32768.0f) < 1e-6f);
    assert(std::fabs(window->samples.back() + 1000.0f / 32768.0f) < 1e-6f);
    assert(window->durationSeconds() >= 3.0);

    // The tail of the last window starts the next one.
    assert(assembler.bufferedSamples() == 24000);
    assert(std::fabs(assembler.bufferedSeconds() - 1.5) < 1e-9);

    // 24000 + 2 * 8192 = 40384 < 48000; the third chunk crosses the threshold.
    assert(!assembler.append(MakeChunk(6, 8192, 0)));
    assert(!assembler.append(MakeChunk(7, 8192, 0)));
    auto second = assembler.append(MakeChunk(8, 8192, 0));
    assert(second.has_value());
    assert(second->index == 1);
    assert(second->samples.size() == 24000 + 3 * 8192);
    assert(second->samples.size() >= 48000);
    assert(assembler.windowsEmitted() == 2);
    std::cout << "[PASS] Window threshold and overlap carry-over" << std::endl;
}

void TestFlush() {
    std::cout << "[Test] Flush keeps only residuals longer than the minimum..." << std::endl;
    WindowAssembler assembler(16000, 3.0, 1.5, 1.0);

    // Exactly 1 s is not more than the minimum: discarded.
    assert(!assembler.append(MakeChunk(0, 16000, 5)));
    assert(!assembler.flush());
    assert(assembler.bufferedSamples() == 0);

    assert(!assembler.append(MakeChunk(1, 16001, 5)));
    auto residual = assembler.flush();
    assert(residual.has_value());
    assert(residual->samples.size() == 16001);
    assert(residual->firstChunk == 1);
    assert(assembler.bufferedSamples() == 0);

    // Nothing left to flush.
    assert(!assembler.flush());
    std::cout << "[PASS] Flush keeps only residuals longer than the minimum" << std::endl;
}

void TestInvalidConfiguration() {
    std::cout << "[Test] Overlap must be shorter than the window..." << std::endl;
    bool threw = false;
    try {
        WindowAssembler bad(16000, 3.0, 3.0, 1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        WindowAssembler bad(16000, 0.0, 0.0, 0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    WindowAssembler noOverlap(16000, 0.5, 0.0, 0.1);
    auto window = noOverlap.append(MakeChunk(0, 8000, 1));
    assert(window.has_value());
    assert(noOverlap.bufferedSamples() == 0);
    std::cout << "[PASS] Overlap must be shorter than the window" << std::endl;
}

} // namespace

int main() {
    TestThresholdAndOverlap();
    TestFlush();
    TestInvalidConfiguration();
    std::cout << "[Test] WindowAssembler: all tests passed." << std::endl;
    return 0;
}
