#include "application/ProjectService.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <set>
#include <system_error>
#include <utility>
#include "domain/LabelTable.hpp"
#include "domain/Timestamp.hpp"

namespace missioncontrol::application {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

double RoundTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

} // namespace

ProjectService::ProjectService(std::filesystem::path projectsRoot, std::string selfDirectoryName)
    : m_root(std::move(projectsRoot)), m_selfDirectoryName(std::move(selfDirectoryName)) {}

std::string ProjectService::DetectTech(const std::filesystem::path& directory) {
    static const std::vector<std::pair<std::string, std::string>> kMarkers = {
        {"package.json", "Node.js"},
        {"tsconfig.json", "TypeScript"},
        {"pyproject.toml", "Python"},
        {"requirements.txt", "Python"},
        {"Cargo.toml", "Rust"},
        {"go.mod", "Go"},
        {"setup.py", "Python"}
    };

    std::vector<std::string> techs;
    for (const auto& [marker, tech] : kMarkers) {
        std::error_code ec;
        if (std::filesystem::exists(directory / marker, ec) &&
            std::find(techs.begin(), techs.end(), tech) == techs.end()) {
            techs.push_back(tech);
        }
    }
    if (techs.empty()) return "Unknown";

    std::string joined;
    for (size_t i = 0; i < techs.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += techs[i];
    }
    return joined;
}

nlohmann::json ProjectService::scanForUnregistered(const std::vector<domain::ProjectRecord>& known) const {
    nlohmann::json found = nlohmann::json::array();

    std::set<std::string> knownPaths;
    for (const auto& project : known) {
        knownPaths.insert(ToLower(project.path));
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(m_root, ec);
    if (ec) {
        std::cerr << "[ProjectService] Cannot scan " << m_root.string() << ": " << ec.message() << std::endl;
        return found;
    }

    std::vector<std::filesystem::directory_entry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    for (const auto& entry : entries) {
        std::error_code entryEc;
        if (!entry.is_directory(entryEc)) continue;

        const std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.' || name == m_selfDirectoryName) continue;

        const std::string pathText = entry.path().string();
        if (knownPaths.count(ToLower(pathText))) continue;

        std::string lastActive;
        auto mtime = std::filesystem::last_write_time(entry.path(), entryEc);
        if (!entryEc) {
            // file_time_type has no portable conversion in C++17; shift through both clocks.
            auto systemTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                mtime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
            lastActive = domain::ToIsoString(systemTime);
        }

        found.push_back({
            {"name", domain::TitleCaseIdentity(name)},
            {"path", pathText},
            {"tech", DetectTech(entry.path())},
            {"status", "unknown"},
            {"source", "auto-detected"},
            {"description", "Auto-detected project in " + name + "/"},
            {"last_active", lastActive},
            {"pinned", false},
            {"tags", nlohmann::json::array()}
        });
    }
    return found;
}

ProjectStats ProjectService::Stats(const std::vector<domain::ProjectRecord>& projects,
                                   const std::vector<domain::SessionSummary>& sessions) {
    ProjectStats stats;
    stats.totalProjects = projects.size();
    for (const auto& project : projects) {
        if (project.status == "active" || project.status == "in_progress") stats.activeProjects++;
        if (project.pinned) stats.pinnedProjects++;
    }
    stats.totalSessions = sessions.size();
    for (const auto& session : sessions) {
        stats.totalMessages += static_cast<size_t>(session.messageCount);
    }
    return stats;
}

std::optional<DiskUsage> ProjectService::diskUsage() const {
    std::error_code ec;
    auto info = std::filesystem::space(m_root, ec);
    if (ec || info.capacity == 0) {
        return std::nullopt;
    }

    const double total = static_cast<double>(info.capacity);
    const double free = static_cast<double>(info.free);
    const double used = total - free;

    DiskUsage usage;
    usage.totalGb = RoundTenth(total / kGiB);
    usage.usedGb = RoundTenth(used / kGiB);
    usage.freeGb = RoundTenth(free / kGiB);
    usage.percentUsed = RoundTenth(used / total * 100.0);
    return usage;
}

} // namespace missioncontrol::application
