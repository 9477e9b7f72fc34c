#include "infrastructure/adapters/HubAdapter.hpp"
#include "infrastructure/adapters/HealthReport.hpp"
#include "infrastructure/HealthClient.hpp"

namespace missioncontrol::infrastructure::adapters {

HubAdapter::HubAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout,
                       std::chrono::milliseconds healthTimeout)
    : SystemAdapter(spec.identity), m_spec(spec), m_probeTimeout(probeTimeout), m_healthTimeout(healthTimeout) {}

domain::SystemStatus HubAdapter::describe() const {
    domain::SystemStatus status = baseStatus();
    status.port = m_spec.port;
    if (!m_spec.url.empty()) status.url = m_spec.url;

    HealthReport report;
    report.probe = TcpProbe::probe(m_spec.host, m_spec.port, m_probeTimeout);
    if (!report.reachable()) {
        status.state = domain::SystemState::Offline;
        status.detail = m_spec.description.empty() ? "Hub not running" : m_spec.description + " (not running)";
        return status;
    }

    status.state = domain::SystemState::Online;
    report.payload = HealthClient(m_spec.host, m_spec.port, m_healthTimeout).getJson("/health");
    if (!report.payload || !report.payload->is_object()) {
        status.detail = "Port open, health check failed";
        return status;
    }

    status.detail = "Model: " + DisplayField(*report.payload, "model") + " | " + DisplayField(*report.payload, "status");
    return status;
}

} // namespace missioncontrol::infrastructure::adapters
