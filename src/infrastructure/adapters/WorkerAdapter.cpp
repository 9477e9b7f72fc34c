#include "infrastructure/adapters/WorkerAdapter.hpp"
#include "infrastructure/adapters/HealthReport.hpp"
#include "infrastructure/HealthClient.hpp"
#include <filesystem>

namespace missioncontrol::infrastructure::adapters {

namespace {

constexpr const char* kKilledStatus = "killed";

} // namespace

WorkerAdapter::WorkerAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout,
                             std::chrono::milliseconds healthTimeout)
    : SystemAdapter(spec.identity), m_spec(spec), m_probeTimeout(probeTimeout), m_healthTimeout(healthTimeout) {}

domain::SystemStatus WorkerAdapter::describe() const {
    domain::SystemStatus status = baseStatus();

    HealthReport report;
    report.probe = TcpProbe::probe(m_spec.host, m_spec.port, m_probeTimeout);
    if (!report.reachable()) {
        std::error_code ec;
        bool installed = !m_spec.directory.empty() && std::filesystem::is_directory(m_spec.directory, ec);
        status.state = installed ? domain::SystemState::Installed : domain::SystemState::Missing;
        status.detail = "Background worker (not running)";
        return status;
    }

    status.state = domain::SystemState::Online;
    status.port = m_spec.port;
    status.url = m_spec.url.empty() ? HttpUrl(m_spec.host, m_spec.port) : m_spec.url;

    report.payload = HealthClient(m_spec.host, m_spec.port, m_healthTimeout).getJson("/health");
    if (!report.payload || !report.payload->is_object()) {
        status.detail = "Port open, health check failed";
        return status;
    }

    const auto& health = *report.payload;
    const std::string active = DisplayField(health, "active_tasks", "0");
    if (DisplayField(health, "status", "") == kKilledStatus) {
        status.detail = "KILLED | " + active + " tasks paused";
        return status;
    }

    status.detail = "Mode: " + DisplayField(health, "mode") + " | " + active + " active, " +
                    DisplayField(health, "completed_today", "0") + " done, " +
                    DisplayField(health, "failed_today", "0") + " failed today";
    return status;
}

} // namespace missioncontrol::infrastructure::adapters
