/**
 * @file CaptureQueue.hpp
 * @brief Ordered hand-off of audio chunks from the capture context to the processing context.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <queue>
#include <vector>
#include "domain/AudioChunk.hpp"

namespace meetinglens::application {

/**
 * @class CaptureQueue
 * @brief Never-blocking producer side, blocking consumer side.
 *
 * push() always accepts while the queue is open so a slow transcription never
 * stalls capture. Depth is not capped; crossing the warning depth is logged
 * once per excursion. After close(), pops drain what is left and then report
 * Closed.
 */
class CaptureQueue {
public:
    enum class PopStatus {
        Chunk,
        Timeout,
        Closed
    };

    explicit CaptureQueue(size_t warnDepth = 64) : m_warnDepth(warnDepth) {}

    /**
     * @brief Wraps the samples in a chunk tagged with the next sequence index.
     * @return False once the queue has been closed.
     */
    bool push(std::vector<int16_t>&& samples) {
        size_t depth = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            domain::AudioChunk chunk;
            chunk.sequence = m_nextSequence++;
            chunk.samples = std::move(samples);
            m_queue.push(std::move(chunk));
            depth = m_queue.size();
            if (depth > m_highWater) m_highWater = depth;
        }
        m_cv.notify_one();

        if (depth > m_warnDepth && !m_warned.exchange(true)) {
            std::cerr << "[CaptureQueue] Processing is falling behind: " << depth
                      << " chunks pending." << std::endl;
        } else if (depth <= m_warnDepth / 2) {
            m_warned = false;
        }
        return true;
    }

    /**
     * @brief Waits up to @p timeout for the next chunk.
     */
    template <typename Rep, typename Period>
    PopStatus popFor(domain::AudioChunk& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        bool ready = m_cv.wait_for(lock, timeout, [this] {
            return !m_queue.empty() || m_closed;
        });
        if (!ready) {
            return PopStatus::Timeout;
        }
        if (m_queue.empty()) {
            return PopStatus::Closed;
        }
        out = std::move(m_queue.front());
        m_queue.pop();
        return PopStatus::Chunk;
    }

    /** @brief Rejects further pushes and wakes the consumer. */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    size_t highWaterMark() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_highWater;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::queue<domain::AudioChunk> m_queue;
    uint64_t m_nextSequence = 0;
    size_t m_highWater = 0;
    size_t m_warnDepth;
    bool m_closed = false;
    std::atomic<bool> m_warned{false};
};

} // namespace meetinglens::application
