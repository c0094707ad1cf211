/**
 * @file AudioSource.hpp
 * @brief Interface for producers of raw audio (microphones, file replays).
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace meetinglens::domain {

/**
 * @class AudioSource
 * @brief Abstract capture context that continuously emits PCM sample blocks.
 *
 * Implementations call the sink from their own thread (or hardware callback).
 * The sink never blocks.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /** @brief Receives each captured block of 16-bit mono samples. */
    using ChunkSink = std::function<void(std::vector<int16_t>&& samples)>;

    /**
     * @brief Opens the device and begins delivering blocks to the sink.
     * @param sink Destination for captured blocks.
     * @param error Populated on failure.
     * @return True if capture started.
     */
    virtual bool start(ChunkSink sink, std::string& error) = 0;

    /** @brief Stops producing. Safe to call more than once. */
    virtual void stop() = 0;

    /**
     * @brief Reports whether the device is still delivering audio.
     * @param error Populated with the reason when the source was lost.
     */
    virtual bool isHealthy(std::string& error) const {
        (void)error;
        return true;
    }

    /** @brief True once a finite source has delivered all of its audio. */
    virtual bool isExhausted() const { return false; }

    /** @brief Sample rate of the delivered blocks. */
    virtual int sampleRate() const = 0;
};

} // namespace meetinglens::domain
