// PathUtils Header
#pragma once
#include <filesystem>

namespace redline::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/redline/settings.json (or ~/.config/...). */
    static std::filesystem::path GetSettingsFile();
};

} // namespace redline::infrastructure
