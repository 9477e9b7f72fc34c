#include "infrastructure/adapters/SelfAdapter.hpp"
#include "infrastructure/adapters/HealthReport.hpp"

namespace missioncontrol::infrastructure::adapters {

SelfAdapter::SelfAdapter(const AdapterSpec& spec, int listenPort)
    : SystemAdapter(spec.identity), m_spec(spec), m_port(spec.port > 0 ? spec.port : listenPort) {}

domain::SystemStatus SelfAdapter::describe() const {
    domain::SystemStatus status = baseStatus();
    status.state = domain::SystemState::Online;
    status.port = m_port;
    status.url = m_spec.url.empty() ? HttpUrl("localhost", m_port) : m_spec.url;
    status.detail = m_spec.description.empty() ? "This dashboard" : m_spec.description;
    return status;
}

} // namespace missioncontrol::infrastructure::adapters
