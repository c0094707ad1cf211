/**
 * @file TranscriptionWorker.hpp
 * @brief Runs speech-to-text on assembled windows and records the results in the ledger.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include "application/SpeechFilter.hpp"
#include "domain/AudioChunk.hpp"
#include "domain/Transcript.hpp"
#include "domain/TranscriptionService.hpp"

namespace meetinglens::application {

/**
 * @class TranscriptionWorker
 * @brief Single consumer of windows; appends at most one segment per window.
 *
 * Windows are handled one at a time on the calling thread, so ledger order is
 * window submission order regardless of inference latency. A failed window is
 * logged and dropped, never retried. Windows the speech filter finds silent
 * never reach the recognizer, and recognizer annotations like "[BLANK_AUDIO]"
 * are not recorded as speech.
 */
class TranscriptionWorker {
public:
    TranscriptionWorker(domain::TranscriptionService& service,
                        domain::TranscriptLedger& ledger,
                        std::string languageHint,
                        std::optional<SpeechFilter> speechFilter = std::nullopt);

    /**
     * @brief Transcribes a window.
     * @return The segment appended to the ledger, or nullopt for silence or failure.
     */
    std::optional<domain::TranscriptSegment> transcribe(const domain::AudioWindow& window);

    uint64_t windowsTranscribed() const { return m_windowsTranscribed.load(); }
    uint64_t windowsDropped() const { return m_windowsDropped.load(); }
    uint64_t windowsSilent() const { return m_windowsSilent.load(); }

private:
    domain::TranscriptionService& m_service;
    domain::TranscriptLedger& m_ledger;
    std::string m_languageHint;
    std::optional<SpeechFilter> m_speechFilter;

    std::atomic<uint64_t> m_windowsTranscribed{0};
    std::atomic<uint64_t> m_windowsDropped{0};
    std::atomic<uint64_t> m_windowsSilent{0};
};

} // namespace meetinglens::application
