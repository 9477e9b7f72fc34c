#include "infrastructure/adapters/PresenceAdapter.hpp"
#include "infrastructure/FileSystemArtifactCounter.hpp"
#include "infrastructure/adapters/HealthReport.hpp"
#include <filesystem>

namespace missioncontrol::infrastructure::adapters {

PresenceAdapter::PresenceAdapter(const AdapterSpec& spec)
    : SystemAdapter(spec.identity), m_spec(spec) {}

std::string PresenceAdapter::staticDetail() const {
    if (!m_spec.description.empty()) return m_spec.description;
    return "Expected at " + m_spec.directory.string();
}

domain::SystemStatus PresenceAdapter::describe() const {
    domain::SystemStatus status = baseStatus();
    if (!m_spec.url.empty()) status.url = m_spec.url;

    std::error_code ec;
    bool installed = !m_spec.directory.empty() && std::filesystem::is_directory(m_spec.directory, ec);
    status.state = installed ? domain::SystemState::Installed : domain::SystemState::Missing;
    status.detail = staticDetail();

    std::optional<std::size_t> count;
    if (!m_spec.journalFile.empty()) {
        count = FileSystemArtifactCounter::countNonBlankLines(m_spec.journalFile);
    } else if (!m_spec.countDirectory.empty()) {
        count = FileSystemArtifactCounter::countFiles(m_spec.countDirectory, m_spec.countExtension);
    }

    if (count && !m_spec.detailTemplate.empty()) {
        status.detail = FillPlaceholder(m_spec.detailTemplate, "{count}", std::to_string(*count));
    }
    return status;
}

domain::SystemStatus PresenceAdapter::unresponsive() const {
    domain::SystemStatus status = baseStatus();
    status.state = domain::SystemState::Missing;
    status.detail = "No response before deadline";
    return status;
}

} // namespace missioncontrol::infrastructure::adapters
