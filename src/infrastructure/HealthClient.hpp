/**
 * @file HealthClient.hpp
 * @brief Low-level HTTP client for subordinate health and status endpoints.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace missioncontrol::infrastructure {

class HealthClient {
public:
    HealthClient(const std::string& host, int port, std::chrono::milliseconds timeout);

    /** @brief GETs a path and parses the body as JSON. nullopt on any failure. */
    std::optional<nlohmann::json> getJson(const std::string& path) const;

    /** @brief Fetches model names from an inference server's /api/tags. */
    std::optional<std::vector<std::string>> getAvailableModels() const;

private:
    std::string m_host;
    int m_port;
    std::chrono::milliseconds m_timeout;
};

} // namespace missioncontrol::infrastructure
