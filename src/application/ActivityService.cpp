#include "application/ActivityService.hpp"
#include <utility>

namespace missioncontrol::application {

ActivityService::ActivityService(infrastructure::SessionLogReader sessionLog,
                                 infrastructure::ProjectRegistryStore registry,
                                 ActivityReconciler reconciler)
    : m_sessionLog(std::move(sessionLog)),
      m_registry(std::move(registry)),
      m_reconciler(std::move(reconciler)) {}

std::vector<domain::SessionSummary> ActivityService::sessionSummaries() const {
    return ActivityReconciler::Summarize(m_sessionLog.readAll());
}

std::vector<domain::ActivityRecord> ActivityService::activeSessions(domain::TimePoint now) const {
    return m_reconciler.reconcile(sessionSummaries(), m_registry.loadProjects(), now);
}

std::vector<domain::ProjectRecord> ActivityService::projects() const {
    return m_registry.loadProjects();
}

nlohmann::json ActivityService::registryDocument() const {
    return m_registry.loadDocument();
}

} // namespace missioncontrol::application
