// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace threadwalker::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();

    /** @brief <config home>/ThreadWalker/settings.json */
    static std::filesystem::path GetSettingsPath();

    /** @brief Default bundle target next to an export: <export dir>/markdown_export. */
    static std::filesystem::path GetDefaultBundleDir(const std::filesystem::path& exportPath);
};

} // namespace threadwalker::infrastructure
