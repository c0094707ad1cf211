/**
 * @file RollingSummary.hpp
 * @brief Compressed stand-ins for earlier transcript, bounded by a word ceiling.
 */

#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <vector>
#include "domain/Transcript.hpp"

namespace meetinglens::domain {

struct RollingSummary {
    std::string text;
    int wordCount = 0;
};

/**
 * @class RollingSummaryStore
 * @brief Ordered summaries with strict oldest-first eviction.
 *
 * After every add() the total word count is at most the ceiling. A single
 * summary is never truncated; it is either kept whole or evicted.
 */
class RollingSummaryStore {
public:
    explicit RollingSummaryStore(int maxTotalWords = 1000)
        : m_maxTotalWords(maxTotalWords) {}

    /**
     * @brief Appends a summary and evicts the oldest entries until the ceiling holds.
     * @return Number of evicted summaries.
     */
    size_t add(const std::string& text) {
        RollingSummary summary{text, CountWords(text)};
        m_summaries.push_back(summary);
        m_totalWords += summary.wordCount;

        size_t evicted = 0;
        while (m_totalWords > m_maxTotalWords && !m_summaries.empty()) {
            m_totalWords -= m_summaries.front().wordCount;
            m_summaries.pop_front();
            ++evicted;
        }
        return evicted;
    }

    int totalWords() const { return m_totalWords; }
    int maxTotalWords() const { return m_maxTotalWords; }
    size_t size() const { return m_summaries.size(); }
    bool empty() const { return m_summaries.empty(); }

    std::vector<RollingSummary> entries() const {
        return std::vector<RollingSummary>(m_summaries.begin(), m_summaries.end());
    }

private:
    int m_maxTotalWords;
    int m_totalWords = 0;
    std::deque<RollingSummary> m_summaries;
};

} // namespace meetinglens::domain
