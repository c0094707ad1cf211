/**
 * @file Transcript.hpp
 * @brief Transcript segments and the append-only ledger that orders them.
 */

#pragma once
#include <cstddef>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace meetinglens::domain {

/** @brief Counts whitespace-separated words. */
inline int CountWords(const std::string& text) {
    std::istringstream ss(text);
    std::string word;
    int count = 0;
    while (ss >> word) {
        ++count;
    }
    return count;
}

/**
 * @struct TranscriptSegment
 * @brief One non-empty piece of transcribed text, in capture order.
 */
struct TranscriptSegment {
    int sequenceIndex = 0;
    std::string text;
    int wordCount = 0;
};

/**
 * @class TranscriptLedger
 * @brief Append-only, ordered record of every segment emitted in a session.
 *
 * Written only by the processing context; readers on other threads get copies.
 */
class TranscriptLedger {
public:
    /**
     * @brief Appends text as the next segment.
     * @return The stored segment (sequence index = previous segment count).
     */
    TranscriptSegment append(const std::string& text) {
        std::lock_guard<std::mutex> lock(m_mutex);
        TranscriptSegment segment;
        segment.sequenceIndex = static_cast<int>(m_segments.size());
        segment.text = text;
        segment.wordCount = CountWords(text);
        m_segments.push_back(segment);
        m_totalWords += segment.wordCount;
        return segment;
    }

    size_t segmentCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_segments.size();
    }

    int totalWords() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_totalWords;
    }

    std::vector<TranscriptSegment> segments() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_segments;
    }

    /** @brief Text of the last @p count segments, oldest first. */
    std::vector<std::string> recentTexts(size_t count) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t first = m_segments.size() > count ? m_segments.size() - count : 0;
        std::vector<std::string> out;
        for (size_t i = first; i < m_segments.size(); ++i) {
            out.push_back(m_segments[i].text);
        }
        return out;
    }

    /** @brief All segments joined with single spaces. */
    std::string fullText() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string out;
        for (const auto& segment : m_segments) {
            if (!out.empty()) out += " ";
            out += segment.text;
        }
        return out;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<TranscriptSegment> m_segments;
    int m_totalWords = 0;
};

} // namespace meetinglens::domain
