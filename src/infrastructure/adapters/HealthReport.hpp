/**
 * @file HealthReport.hpp
 * @brief Probe result plus optional enrichment payload, private to the adapters.
 */

#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/TcpProbe.hpp"

namespace missioncontrol::infrastructure::adapters {

struct HealthReport {
    ProbeResult probe = ProbeResult::Unreachable;
    std::optional<nlohmann::json> payload;

    bool reachable() const { return probe == ProbeResult::Reachable; }
};

/** @brief Renders a payload field for a detail line; `fallback` when absent or null. */
inline std::string DisplayField(const nlohmann::json& payload, const char* key, const std::string& fallback = "?") {
    if (!payload.is_object()) return fallback;
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

/** @brief Replaces every `placeholder` in `pattern` with `value`. */
inline std::string FillPlaceholder(const std::string& pattern, const std::string& placeholder,
                                   const std::string& value) {
    std::string out = pattern;
    size_t pos = out.find(placeholder);
    while (pos != std::string::npos) {
        out.replace(pos, placeholder.size(), value);
        pos = out.find(placeholder, pos + value.size());
    }
    return out;
}

inline std::string HttpUrl(const std::string& host, int port, const std::string& path = "") {
    return "http://" + host + ":" + std::to_string(port) + path;
}

} // namespace missioncontrol::infrastructure::adapters
