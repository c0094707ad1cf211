/**
 * @file SpeechFilter.cpp
 * @brief Implementation of the SpeechFilter class.
 */

#include "application/SpeechFilter.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace meetinglens::application {

namespace {

float FrameRms(const float* data, size_t count) {
    if (count == 0) return 0.0f;
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(data[i]) * data[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

} // namespace

SpeechFilter::SpeechFilter(VadSettings settings, int sampleRate)
    : m_settings(settings)
    , m_frameSamples(0)
{
    if (sampleRate <= 0 || settings.frameMs <= 0) {
        throw std::invalid_argument("SpeechFilter: sample rate and frame length must be positive");
    }
    m_frameSamples = std::max<size_t>(1, static_cast<size_t>(sampleRate) * settings.frameMs / 1000);
}

size_t SpeechFilter::msToFrames(int ms) const {
    if (ms <= 0) return 0;
    return static_cast<size_t>((ms + m_settings.frameMs - 1) / m_settings.frameMs);
}

std::vector<float> SpeechFilter::apply(const std::vector<float>& samples) const {
    if (!m_settings.enabled) {
        return samples;
    }

    const size_t frames = (samples.size() + m_frameSamples - 1) / m_frameSamples;
    std::vector<bool> voiced(frames, false);
    size_t voicedFrames = 0;
    for (size_t f = 0; f < frames; ++f) {
        size_t begin = f * m_frameSamples;
        size_t count = std::min(m_frameSamples, samples.size() - begin);
        if (FrameRms(samples.data() + begin, count) >= m_settings.threshold) {
            voiced[f] = true;
            ++voicedFrames;
        }
    }

    if (voicedFrames == 0 || voicedFrames * m_settings.frameMs < static_cast<size_t>(std::max(m_settings.minSpeechMs, 0))) {
        return {};
    }

    // Pad speech, then bridge pauses shorter than the minimum silence.
    const size_t pad = msToFrames(m_settings.speechPadMs);
    std::vector<bool> keep(frames, false);
    for (size_t f = 0; f < frames; ++f) {
        if (!voiced[f]) continue;
        size_t from = f > pad ? f - pad : 0;
        size_t to = std::min(frames, f + pad + 1);
        std::fill(keep.begin() + from, keep.begin() + to, true);
    }

    const size_t minSilence = msToFrames(m_settings.minSilenceMs);
    size_t lastKept = frames;
    for (size_t f = 0; f < frames; ++f) {
        if (!keep[f]) continue;
        if (lastKept != frames && f - lastKept - 1 < minSilence) {
            std::fill(keep.begin() + lastKept + 1, keep.begin() + f, true);
        }
        lastKept = f;
    }

    std::vector<float> speech;
    speech.reserve(samples.size());
    for (size_t f = 0; f < frames; ++f) {
        if (!keep[f]) continue;
        size_t begin = f * m_frameSamples;
        size_t end = std::min(begin + m_frameSamples, samples.size());
        speech.insert(speech.end(), samples.begin() + begin, samples.begin() + end);
    }
    return speech;
}

} // namespace meetinglens::application
