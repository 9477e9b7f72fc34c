// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace missioncontrol::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultSettingsFile();
    /** @brief Expands a leading "~" to the home directory. */
    static std::filesystem::path ExpandUser(const std::string& path);
    /** @brief Expands "~" and resolves relative paths against base. */
    static std::filesystem::path Resolve(const std::string& path, const std::filesystem::path& base);
};

} // namespace missioncontrol::infrastructure
