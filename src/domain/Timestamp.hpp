/**
 * @file Timestamp.hpp
 * @brief UTC time point helpers shared by the log reader, the registry reader and the reconciler.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace missioncontrol::domain {

using TimePoint = std::chrono::system_clock::time_point;

/** @brief Converts a millisecond Unix epoch into a time point. */
TimePoint FromEpochMillis(long long millis);

/**
 * @brief Parses an ISO-8601 timestamp as written in the project registry.
 *
 * Accepts a bare date (`2024-01-01`, read as 23:59:59 UTC that day) or a full
 * timestamp with optional seconds, fraction and `Z`/`+HH:MM` offset. A timestamp
 * without offset is taken as UTC.
 * @return std::nullopt when the text is not a timestamp.
 */
std::optional<TimePoint> ParseIsoTimestamp(const std::string& text);

/** @brief Formats as `YYYY-MM-DDTHH:MM:SS.mmmZ`. */
std::string ToIsoString(TimePoint tp);

/** @brief Formats as `YYYY-MM-DD HH:MM` (UTC). */
std::string ToShortDate(TimePoint tp);

} // namespace missioncontrol::domain
