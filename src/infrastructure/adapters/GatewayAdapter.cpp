#include "infrastructure/adapters/GatewayAdapter.hpp"
#include "infrastructure/adapters/HealthReport.hpp"
#include <fstream>
#include <iostream>

namespace missioncontrol::infrastructure::adapters {

using json = nlohmann::json;

namespace {

constexpr const char* kProviderPrefix = "ollama/";

std::string StripProvider(const std::string& model) {
    const std::string prefix = kProviderPrefix;
    if (model.compare(0, prefix.size(), prefix) == 0) {
        return model.substr(prefix.size());
    }
    return model;
}

} // namespace

GatewayAdapter::GatewayAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout)
    : SystemAdapter(spec.identity), m_spec(spec), m_probeTimeout(probeTimeout) {}

std::optional<json> GatewayAdapter::readConfig() const {
    std::error_code ec;
    if (m_spec.configFile.empty() || !std::filesystem::exists(m_spec.configFile, ec)) {
        return std::nullopt;
    }
    try {
        std::ifstream f(m_spec.configFile);
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        std::cerr << "[GatewayAdapter] Error reading " << m_spec.configFile.string() << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

domain::SystemStatus GatewayAdapter::describe() const {
    domain::SystemStatus status = baseStatus();
    status.port = m_spec.port;
    status.url = m_spec.url.empty() ? HttpUrl(m_spec.host, m_spec.port, "/") : m_spec.url;

    HealthReport report;
    report.probe = TcpProbe::probe(m_spec.host, m_spec.port, m_probeTimeout);
    if (!report.reachable()) {
        status.state = domain::SystemState::Offline;
        status.detail = "Gateway not running";
        return status;
    }

    status.state = domain::SystemState::Online;
    status.detail = "Gateway online, config unreadable";
    report.payload = readConfig();
    if (!report.payload || !report.payload->is_object()) {
        return status;
    }

    try {
        const json& cfg = *report.payload;
        std::string model = cfg.value(json::json_pointer("/agents/defaults/model/primary"), std::string());

        int plugins = 0;
        auto entries = cfg.value(json::json_pointer("/plugins/entries"), json::object());
        for (const auto& item : entries.items()) {
            const json& plugin = item.value();
            if (plugin.is_object() && plugin.value("enabled", false)) {
                ++plugins;
            }
        }
        status.detail = "Model: " + StripProvider(model) + " | " + std::to_string(plugins) + " plugins";
    } catch (const json::exception& e) {
        std::cerr << "[GatewayAdapter] Unexpected config shape: " << e.what() << std::endl;
    }
    return status;
}

} // namespace missioncontrol::infrastructure::adapters
