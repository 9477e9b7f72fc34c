/**
 * @file SystemStatus.hpp
 * @brief Normalized status of one subordinate system.
 */

#pragma once
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace missioncontrol::domain {

/**
 * @enum SystemState
 * @brief The only four states a system can be reported in.
 */
enum class SystemState {
    Online,
    Offline,
    Installed,
    Missing
};

inline std::string StateToString(SystemState state) {
    switch (state) {
        case SystemState::Online: return "online";
        case SystemState::Offline: return "offline";
        case SystemState::Installed: return "installed";
        case SystemState::Missing: return "missing";
    }
    return "offline";
}

/**
 * @struct SystemStatus
 * @brief Value object produced fresh on every aggregation pass.
 *
 * `detail` always carries a human-readable reason, also for offline/missing systems.
 */
struct SystemStatus {
    std::string id;
    std::string displayName;
    std::string icon;
    SystemState state = SystemState::Offline;
    std::optional<int> port;
    std::optional<std::string> url;
    std::string detail;
    std::set<std::string> tags;
};

inline void to_json(nlohmann::json& j, const SystemStatus& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"name", s.displayName},
        {"icon", s.icon},
        {"status", StateToString(s.state)},
        {"port", nullptr},
        {"url", nullptr},
        {"detail", s.detail},
        {"tags", s.tags}
    };
    if (s.port) j["port"] = *s.port;
    if (s.url) j["url"] = *s.url;
}

} // namespace missioncontrol::domain
