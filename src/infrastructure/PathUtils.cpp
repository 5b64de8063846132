#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace threadwalker::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / "ThreadWalker" / "settings.json";
}

fs::path PathUtils::GetDefaultBundleDir(const fs::path& exportPath) {
    fs::path base = fs::is_directory(exportPath) ? exportPath : exportPath.parent_path();
    if (base.empty()) {
        base = fs::current_path();
    }
    return base / "markdown_export";
}

} // namespace threadwalker::infrastructure
