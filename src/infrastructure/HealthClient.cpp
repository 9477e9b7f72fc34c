#include "infrastructure/HealthClient.hpp"
#include <httplib.h>
#include <iostream>

namespace missioncontrol::infrastructure {

using json = nlohmann::json;

HealthClient::HealthClient(const std::string& host, int port, std::chrono::milliseconds timeout)
    : m_host(host), m_port(port), m_timeout(timeout) {}

std::optional<json> HealthClient::getJson(const std::string& path) const {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_timeout);
    cli.set_read_timeout(m_timeout);
    cli.set_write_timeout(m_timeout);

    auto res = cli.Get(path, httplib::Headers{{"Accept", "application/json"}});
    if (!res) {
        std::cerr << "[HealthClient] " << m_host << ":" << m_port << path
                  << " connection failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[HealthClient] " << m_host << ":" << m_port << path
                  << " HTTP Error " << res->status << std::endl;
        return std::nullopt;
    }

    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        std::cerr << "[HealthClient] JSON Parse Error from " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> HealthClient::getAvailableModels() const {
    auto body = getJson("/api/tags");
    if (!body || !body->is_object()) return std::nullopt;

    std::vector<std::string> models;
    if (body->contains("models") && (*body)["models"].is_array()) {
        for (const auto& item : (*body)["models"]) {
            if (item.is_object() && item.contains("name") && item["name"].is_string()) {
                models.push_back(item["name"].get<std::string>());
            } else {
                models.push_back("?");
            }
        }
    }
    return models;
}

} // namespace missioncontrol::infrastructure
