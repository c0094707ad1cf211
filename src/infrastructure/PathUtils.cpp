/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace meetinglens::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromXdg(const char* xdgVar, const fs::path& homeRelative) {
    const char* xdg = std::getenv(xdgVar);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return FromXdg("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return FromXdg("XDG_CONFIG_HOME", ".config");
}

// Not created here: a missing models directory is reported when the model fails to load.
fs::path PathUtils::GetModelsDir() {
    return GetDataHome() / "MeetingLens" / "models";
}

} // namespace meetinglens::infrastructure
