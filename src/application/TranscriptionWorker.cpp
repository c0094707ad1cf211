/**
 * @file TranscriptionWorker.cpp
 * @brief Implementation of the TranscriptionWorker class.
 */

#include "application/TranscriptionWorker.hpp"
#include <exception>
#include <iostream>
#include <vector>

namespace meetinglens::application {

namespace {

std::string Trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::string Preview(const std::string& text) {
    constexpr size_t kMaxPreview = 80;
    return text.size() > kMaxPreview ? text.substr(0, kMaxPreview) + "..." : text;
}

} // namespace

TranscriptionWorker::TranscriptionWorker(domain::TranscriptionService& service,
                                         domain::TranscriptLedger& ledger,
                                         std::string languageHint,
                                         std::optional<SpeechFilter> speechFilter)
    : m_service(service)
    , m_ledger(ledger)
    , m_languageHint(std::move(languageHint))
    , m_speechFilter(std::move(speechFilter)) {}

std::optional<domain::TranscriptSegment> TranscriptionWorker::transcribe(const domain::AudioWindow& window) {
    std::vector<float> filtered;
    const std::vector<float>* samples = &window.samples;
    if (m_speechFilter && m_speechFilter->enabled()) {
        filtered = m_speechFilter->apply(window.samples);
        if (filtered.empty()) {
            ++m_windowsSilent;
            return std::nullopt;
        }
        samples = &filtered;
    }

    std::vector<domain::TranscribedSpan> spans;
    std::string error;
    bool ok = false;

    try {
        ok = m_service.transcribe(*samples, window.sampleRate, m_languageHint, spans, error);
    } catch (const std::exception& e) {
        ok = false;
        error = e.what();
    }

    if (!ok) {
        ++m_windowsDropped;
        std::cerr << "[TranscriptionWorker] Window " << window.index << " dropped: "
                  << (error.empty() ? "unknown error" : error) << std::endl;
        return std::nullopt;
    }

    std::string joined;
    for (const auto& span : spans) {
        std::string piece = Trim(span.text);
        if (piece.empty() || domain::IsNonSpeechMarker(piece)) continue;
        if (!joined.empty()) joined += " ";
        joined += piece;
    }

    if (joined.empty()) {
        ++m_windowsSilent;
        return std::nullopt;
    }

    domain::TranscriptSegment segment = m_ledger.append(joined);
    ++m_windowsTranscribed;
    std::cout << "[TranscriptionWorker] Transcribed: " << Preview(joined) << std::endl;
    return segment;
}

} // namespace meetinglens::application
