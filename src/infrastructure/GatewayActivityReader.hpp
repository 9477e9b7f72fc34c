/**
 * @file GatewayActivityReader.hpp
 * @brief Reads the agent gateway's workspace files: sessions, daily notes, overnight queue, heartbeat.
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure {

/**
 * @class GatewayActivityReader
 * @brief Read-only. Every source is optional; a missing or unreadable file leaves its
 *        section empty (or null for the heartbeat).
 */
class GatewayActivityReader {
public:
    static constexpr size_t kMaxSessions = 10;
    static constexpr size_t kMaxNotes = 10;
    static constexpr size_t kMaxOvernightTasks = 10;

    explicit GatewayActivityReader(GatewaySettings settings);

    /**
     * @brief `{sessions, daily_notes, overnight_tasks, heartbeat}`.
     * @param today Local date `YYYY-MM-DD` naming the daily note to read.
     */
    nlohmann::json activity(const std::string& today) const;

    /**
     * @brief Port state plus what the gateway config says about itself:
     *        `{status, port, version, model, plugins, telegram, workspace}`.
     */
    nlohmann::json health(std::chrono::milliseconds probeTimeout) const;

    /** @brief Local calendar date of `now` as `YYYY-MM-DD`. */
    static std::string LocalDate(std::chrono::system_clock::time_point now);

private:
    nlohmann::json readSessions() const;
    nlohmann::json readDailyNotes(const std::string& today) const;
    nlohmann::json readOvernightTasks() const;

    GatewaySettings m_settings;
};

} // namespace missioncontrol::infrastructure
