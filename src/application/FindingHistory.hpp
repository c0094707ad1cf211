/**
 * @file FindingHistory.hpp
 * @brief Per-category record of findings already reported, used to suppress repeats.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace meetinglens::application {

/**
 * @class FindingHistory
 * @brief Grows for the whole session; only the newest entries take part in matching.
 *
 * A candidate is a repeat when, ignoring case, it is a substring of a recent
 * entry or a recent entry is a substring of it. Rewordings are not caught.
 */
class FindingHistory {
public:
    explicit FindingHistory(size_t lookback = 10) : m_lookback(lookback) {}

    /** @brief Returns the candidates that are not repeats of the last lookback entries. */
    std::vector<std::string> filterNew(const std::vector<std::string>& candidates) const;

    /** @brief Appends findings to the history. */
    void record(const std::vector<std::string>& findings);

    /** @brief The newest @p count entries, oldest first. */
    std::vector<std::string> recent(size_t count) const;

    size_t size() const { return m_entries.size(); }

private:
    bool isRepeat(const std::string& candidate) const;

    size_t m_lookback;
    std::vector<std::string> m_entries;
};

} // namespace meetinglens::application
