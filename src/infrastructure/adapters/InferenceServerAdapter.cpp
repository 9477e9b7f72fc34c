#include "infrastructure/adapters/InferenceServerAdapter.hpp"
#include "infrastructure/adapters/HealthReport.hpp"
#include "infrastructure/HealthClient.hpp"

namespace missioncontrol::infrastructure::adapters {

InferenceServerAdapter::InferenceServerAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout,
                                               std::chrono::milliseconds healthTimeout)
    : SystemAdapter(spec.identity), m_spec(spec), m_probeTimeout(probeTimeout), m_healthTimeout(healthTimeout) {}

domain::SystemStatus InferenceServerAdapter::describe() const {
    domain::SystemStatus status = baseStatus();
    status.port = m_spec.port;
    if (!m_spec.url.empty()) status.url = m_spec.url;

    if (!TcpProbe::isReachable(m_spec.host, m_spec.port, m_probeTimeout)) {
        status.state = domain::SystemState::Offline;
        status.detail = "Not running - start with: ollama serve";
        return status;
    }

    status.state = domain::SystemState::Online;
    status.detail = m_spec.description.empty() ? "Local LLM inference" : m_spec.description;

    auto models = HealthClient(m_spec.host, m_spec.port, m_healthTimeout).getAvailableModels();
    if (!models) {
        return status;
    }

    std::string listed;
    for (size_t i = 0; i < models->size() && i < kListedModels; ++i) {
        if (i > 0) listed += ", ";
        listed += (*models)[i];
    }
    status.detail = std::to_string(models->size()) + " models: " + listed;
    return status;
}

} // namespace missioncontrol::infrastructure::adapters
