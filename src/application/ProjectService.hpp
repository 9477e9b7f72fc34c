/**
 * @file ProjectService.hpp
 * @brief Read-only views over the projects root and its registry.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ProjectRecord.hpp"
#include "domain/SessionRecord.hpp"

namespace missioncontrol::application {

/** @brief Space figures for the volume holding the projects root, in GiB rounded to one decimal. */
struct DiskUsage {
    double totalGb = 0.0;
    double usedGb = 0.0;
    double freeGb = 0.0;
    double percentUsed = 0.0;
};

inline void to_json(nlohmann::json& j, const DiskUsage& d) {
    j = nlohmann::json{
        {"total_gb", d.totalGb},
        {"used_gb", d.usedGb},
        {"free_gb", d.freeGb},
        {"percent_used", d.percentUsed}
    };
}

/** @brief Header counters shown by the dashboard. */
struct ProjectStats {
    size_t totalProjects = 0;
    size_t activeProjects = 0;
    size_t pinnedProjects = 0;
    size_t totalSessions = 0;
    size_t totalMessages = 0;
};

inline void to_json(nlohmann::json& j, const ProjectStats& s) {
    j = nlohmann::json{
        {"totalProjects", s.totalProjects},
        {"activeProjects", s.activeProjects},
        {"pinnedProjects", s.pinnedProjects},
        {"totalSessions", s.totalSessions},
        {"totalMessages", s.totalMessages}
    };
}

class ProjectService {
public:
    ProjectService(std::filesystem::path projectsRoot, std::string selfDirectoryName);

    /**
     * @brief Lists directories under the root that the registry does not know yet.
     *
     * Hidden directories and the dashboard's own directory are skipped. Paths are
     * compared case-insensitively. Nothing is written; importing belongs to the
     * registry's owner.
     */
    nlohmann::json scanForUnregistered(const std::vector<domain::ProjectRecord>& known) const;

    /** @brief Comma-separated technologies guessed from marker files, or "Unknown". */
    static std::string DetectTech(const std::filesystem::path& directory);

    static ProjectStats Stats(const std::vector<domain::ProjectRecord>& projects,
                              const std::vector<domain::SessionSummary>& sessions);

    /** @brief std::nullopt when the root does not exist or the volume cannot be queried. */
    std::optional<DiskUsage> diskUsage() const;

private:
    std::filesystem::path m_root;
    std::string m_selfDirectoryName;
};

} // namespace missioncontrol::application
