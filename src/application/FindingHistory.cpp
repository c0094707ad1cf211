/**
 * @file FindingHistory.cpp
 * @brief Implementation of FindingHistory.
 */

#include "application/FindingHistory.hpp"
#include <algorithm>
#include <cctype>

namespace meetinglens::application {

namespace {

std::string ToLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

bool FindingHistory::isRepeat(const std::string& candidate) const {
    std::string lowered = ToLower(candidate);
    size_t first = m_entries.size() > m_lookback ? m_entries.size() - m_lookback : 0;
    for (size_t i = first; i < m_entries.size(); ++i) {
        std::string previous = ToLower(m_entries[i]);
        if (previous.find(lowered) != std::string::npos || lowered.find(previous) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> FindingHistory::filterNew(const std::vector<std::string>& candidates) const {
    std::vector<std::string> kept;
    for (const auto& candidate : candidates) {
        if (!isRepeat(candidate)) {
            kept.push_back(candidate);
        }
    }
    return kept;
}

void FindingHistory::record(const std::vector<std::string>& findings) {
    m_entries.insert(m_entries.end(), findings.begin(), findings.end());
}

std::vector<std::string> FindingHistory::recent(size_t count) const {
    size_t first = m_entries.size() > count ? m_entries.size() - count : 0;
    return std::vector<std::string>(m_entries.begin() + static_cast<std::ptrdiff_t>(first), m_entries.end());
}

} // namespace meetinglens::application
