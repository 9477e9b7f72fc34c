/**
 * @file ActivityReconciler.hpp
 * @brief Merges session-log summaries and project-metadata timestamps into one feed.
 */

#pragma once

#include <chrono>
#include <vector>
#include "domain/ActivityRecord.hpp"
#include "domain/LabelTable.hpp"
#include "domain/ProjectRecord.hpp"
#include "domain/SessionRecord.hpp"

namespace missioncontrol::application {

/**
 * @class ActivityReconciler
 * @brief Pure reconciliation over already-loaded inputs.
 *
 * Identical inputs at the same `now` produce identical output. Each project
 * identity appears at most once; a session-log record always wins over a
 * project-metadata record for the same identity.
 */
class ActivityReconciler {
public:
    ActivityReconciler(domain::LabelTable labels, std::chrono::hours window);

    /**
     * @brief Groups log entries by sessionId.
     *
     * Message count is the number of entries, first message comes from the first
     * entry seen, timestamps are the min and max. Sorted by lastTimestamp
     * descending; ties keep first-seen order.
     */
    static std::vector<domain::SessionSummary> Summarize(const std::vector<domain::SessionEntry>& entries);

    std::vector<domain::ActivityRecord> reconcile(const std::vector<domain::SessionSummary>& summaries,
                                                  const std::vector<domain::ProjectRecord>& projects,
                                                  domain::TimePoint now) const;

    /** @brief True when `ts` lies less than one window away from `now`, past or future. */
    bool withinWindow(domain::TimePoint ts, domain::TimePoint now) const;

    const domain::LabelTable& labels() const { return m_labels; }

private:
    domain::LabelTable m_labels;
    std::chrono::hours m_window;
};

} // namespace missioncontrol::application
