#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace missioncontrol::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetHome() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    return GetHome() / ".config";
}

fs::path PathUtils::GetDefaultSettingsFile() {
    return GetConfigHome() / "mission-control" / "settings.json";
}

fs::path PathUtils::ExpandUser(const std::string& path) {
    if (path == "~") {
        return GetHome();
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        return GetHome() / path.substr(2);
    }
    return fs::path(path);
}

fs::path PathUtils::Resolve(const std::string& path, const fs::path& base) {
    if (path.empty()) return fs::path();
    fs::path expanded = ExpandUser(path);
    if (expanded.is_absolute() || base.empty()) {
        return expanded;
    }
    return base / expanded;
}

} // namespace missioncontrol::infrastructure
