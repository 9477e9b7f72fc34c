/**
 * @file ActivityService.hpp
 * @brief Loads the session log and the project registry for each request and feeds the reconciler.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "application/ActivityReconciler.hpp"
#include "infrastructure/ProjectRegistryStore.hpp"
#include "infrastructure/SessionLogReader.hpp"

namespace missioncontrol::application {

/**
 * @class ActivityService
 * @brief Stateless between requests; every call re-reads its sources.
 */
class ActivityService {
public:
    ActivityService(infrastructure::SessionLogReader sessionLog,
                    infrastructure::ProjectRegistryStore registry,
                    ActivityReconciler reconciler);

    /** @brief Every session in the log, newest first. */
    std::vector<domain::SessionSummary> sessionSummaries() const;

    /** @brief The reconciled feed as of `now`. */
    std::vector<domain::ActivityRecord> activeSessions(domain::TimePoint now) const;

    std::vector<domain::ProjectRecord> projects() const;

    /** @brief The registry document as stored. */
    nlohmann::json registryDocument() const;

private:
    infrastructure::SessionLogReader m_sessionLog;
    infrastructure::ProjectRegistryStore m_registry;
    ActivityReconciler m_reconciler;
};

} // namespace missioncontrol::application
