#include "infrastructure/adapters/ServiceAdapter.hpp"
#include "infrastructure/adapters/HealthReport.hpp"
#include <filesystem>

namespace missioncontrol::infrastructure::adapters {

ServiceAdapter::ServiceAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout)
    : SystemAdapter(spec.identity), m_spec(spec), m_probeTimeout(probeTimeout) {}

domain::SystemStatus ServiceAdapter::describe() const {
    domain::SystemStatus status = baseStatus();

    if (TcpProbe::isReachable(m_spec.host, m_spec.port, m_probeTimeout)) {
        status.state = domain::SystemState::Online;
        status.port = m_spec.port;
        status.url = m_spec.url.empty() ? HttpUrl("localhost", m_spec.port) : m_spec.url;
        const std::string pattern = m_spec.onlineDetail.empty() ? "Listening on :{port}" : m_spec.onlineDetail;
        status.detail = FillPlaceholder(pattern, "{port}", std::to_string(m_spec.port));
        return status;
    }

    std::error_code ec;
    bool installed = !m_spec.directory.empty() && std::filesystem::is_directory(m_spec.directory, ec);
    status.state = installed ? domain::SystemState::Installed : domain::SystemState::Missing;
    status.detail = m_spec.description.empty() ? "Not running" : m_spec.description;
    return status;
}

} // namespace missioncontrol::infrastructure::adapters
