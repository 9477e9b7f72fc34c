/**
 * @file SessionRecord.hpp
 * @brief Entries of the append-only session log and their per-session grouping.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "Timestamp.hpp"

namespace missioncontrol::domain {

/**
 * @struct SessionEntry
 * @brief One parsed line of the session log. Several entries share a sessionId.
 */
struct SessionEntry {
    std::string sessionId;
    std::string project;           ///< Raw project path as logged.
    std::string preview;           ///< First 200 characters of the message.
    TimePoint timestamp;
};

/**
 * @struct SessionSummary
 * @brief All entries of one session folded together; rebuilt on every request.
 */
struct SessionSummary {
    std::string sessionId;
    std::string project;
    std::string firstMessage;
    int messageCount = 0;
    TimePoint firstTimestamp;
    TimePoint lastTimestamp;
};

inline void to_json(nlohmann::json& j, const SessionSummary& s) {
    j = nlohmann::json{
        {"sessionId", s.sessionId},
        {"project", s.project},
        {"firstMessage", s.firstMessage},
        {"messageCount", s.messageCount},
        {"firstTimestamp", ToIsoString(s.firstTimestamp)},
        {"lastTimestamp", ToIsoString(s.lastTimestamp)},
        {"firstDate", ToShortDate(s.firstTimestamp)},
        {"lastDate", ToShortDate(s.lastTimestamp)}
    };
}

} // namespace missioncontrol::domain
