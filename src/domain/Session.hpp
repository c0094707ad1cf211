/**
 * @file Session.hpp
 * @brief Identity and lifecycle state of one capture session.
 */

#pragma once
#include <chrono>
#include <string>

namespace meetinglens::domain {

enum class SessionState {
    Idle,
    Recording,
    Stopping
};

inline const char* SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Stopping: return "stopping";
    }
    return "idle";
}

/**
 * @struct Session
 * @brief Value owned by the orchestrator; replaced on every start().
 */
struct Session {
    std::string id;
    std::chrono::system_clock::time_point startTime;
    std::chrono::steady_clock::time_point startedAt; ///< Monotonic start for durations.
    std::chrono::steady_clock::time_point endedAt; ///< Set when the session returns to Idle.
    bool ended = false;
    SessionState state = SessionState::Idle;

    double durationSeconds() const {
        if (id.empty()) return 0.0;
        auto end = ended ? endedAt : std::chrono::steady_clock::now();
        return std::chrono::duration<double>(end - startedAt).count();
    }
};

} // namespace meetinglens::domain
