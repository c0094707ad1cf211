/**
 * @file PathUtils.hpp
 * @brief XDG base directory lookup for settings and downloaded models.
 */
#pragma once
#include <string>
#include <filesystem>

namespace meetinglens::infrastructure {

/**
 * @class PathUtils
 * @brief Resolves per-user directories, honoring XDG_DATA_HOME and XDG_CONFIG_HOME.
 */
class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /** @brief Default location of whisper model files (<data home>/MeetingLens/models). */
    static std::filesystem::path GetModelsDir();
};

} // namespace meetinglens::infrastructure
