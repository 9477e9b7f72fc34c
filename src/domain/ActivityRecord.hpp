/**
 * @file ActivityRecord.hpp
 * @brief One line of the reconciled activity feed.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "Timestamp.hpp"

namespace missioncontrol::domain {

/**
 * @enum Provenance
 * @brief Which source produced a record. Session-log wins over project-metadata.
 */
enum class Provenance {
    SessionLog,
    ProjectMetadata
};

inline std::string ProvenanceToString(Provenance p) {
    return p == Provenance::SessionLog ? "session-log" : "project-metadata";
}

struct ActivityRecord {
    std::string identity;          ///< Normalized project slug, unique per pass.
    std::string label;
    std::string firstMessage;
    int messageCount = 0;
    TimePoint firstTimestamp;
    TimePoint lastTimestamp;
    Provenance provenance = Provenance::SessionLog;
    std::string sessionId;
    std::string project;           ///< Raw path the identity was derived from.
};

inline bool operator==(const ActivityRecord& a, const ActivityRecord& b) {
    return a.identity == b.identity && a.label == b.label && a.firstMessage == b.firstMessage &&
           a.messageCount == b.messageCount && a.firstTimestamp == b.firstTimestamp &&
           a.lastTimestamp == b.lastTimestamp && a.provenance == b.provenance &&
           a.sessionId == b.sessionId && a.project == b.project;
}

inline void to_json(nlohmann::json& j, const ActivityRecord& r) {
    j = nlohmann::json{
        {"identity", r.identity},
        {"projectName", r.identity},
        {"label", r.label},
        {"firstMessage", r.firstMessage},
        {"messageCount", r.messageCount},
        {"firstTimestamp", ToIsoString(r.firstTimestamp)},
        {"lastTimestamp", ToIsoString(r.lastTimestamp)},
        {"lastDate", ToShortDate(r.lastTimestamp)},
        {"provenance", ProvenanceToString(r.provenance)},
        {"sessionId", r.sessionId},
        {"project", r.project}
    };
}

} // namespace missioncontrol::domain
