#include "application/ActivityReconciler.hpp"
#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

namespace missioncontrol::application {

namespace {

void SortByRecency(std::vector<domain::ActivityRecord>& records) {
    std::stable_sort(records.begin(), records.end(),
                     [](const domain::ActivityRecord& a, const domain::ActivityRecord& b) {
                         return a.lastTimestamp > b.lastTimestamp;
                     });
}

} // namespace

ActivityReconciler::ActivityReconciler(domain::LabelTable labels, std::chrono::hours window)
    : m_labels(std::move(labels)), m_window(window) {}

std::vector<domain::SessionSummary> ActivityReconciler::Summarize(const std::vector<domain::SessionEntry>& entries) {
    std::vector<domain::SessionSummary> summaries;
    std::unordered_map<std::string, size_t> indexById;

    for (const auto& entry : entries) {
        auto it = indexById.find(entry.sessionId);
        if (it == indexById.end()) {
            domain::SessionSummary summary;
            summary.sessionId = entry.sessionId;
            summary.project = entry.project;
            summary.firstMessage = entry.preview;
            summary.firstTimestamp = entry.timestamp;
            summary.lastTimestamp = entry.timestamp;
            indexById.emplace(entry.sessionId, summaries.size());
            summaries.push_back(std::move(summary));
            it = indexById.find(entry.sessionId);
        }

        auto& summary = summaries[it->second];
        summary.messageCount++;
        summary.firstTimestamp = std::min(summary.firstTimestamp, entry.timestamp);
        summary.lastTimestamp = std::max(summary.lastTimestamp, entry.timestamp);
    }

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const domain::SessionSummary& a, const domain::SessionSummary& b) {
                         return a.lastTimestamp > b.lastTimestamp;
                     });
    return summaries;
}

bool ActivityReconciler::withinWindow(domain::TimePoint ts, domain::TimePoint now) const {
    const auto age = now - ts;
    return age < m_window && age > -std::chrono::duration_cast<domain::TimePoint::duration>(m_window);
}

std::vector<domain::ActivityRecord> ActivityReconciler::reconcile(
    const std::vector<domain::SessionSummary>& summaries,
    const std::vector<domain::ProjectRecord>& projects,
    domain::TimePoint now) const {

    // Newest first, so the first summary kept for an identity is its latest one.
    std::vector<domain::SessionSummary> ordered(summaries);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const domain::SessionSummary& a, const domain::SessionSummary& b) {
                         return a.lastTimestamp > b.lastTimestamp;
                     });

    std::vector<domain::ActivityRecord> records;
    std::set<std::string> seen;

    for (const auto& summary : ordered) {
        if (!withinWindow(summary.lastTimestamp, now)) continue;

        const std::string identity = domain::NormalizeProjectIdentity(summary.project);
        if (seen.count(identity)) continue;

        domain::ActivityRecord record;
        record.identity = identity;
        record.label = m_labels.resolve(identity, summary.firstMessage);
        record.firstMessage = summary.firstMessage;
        record.messageCount = summary.messageCount;
        record.firstTimestamp = summary.firstTimestamp;
        record.lastTimestamp = summary.lastTimestamp;
        record.provenance = domain::Provenance::SessionLog;
        record.sessionId = summary.sessionId;
        record.project = summary.project;

        seen.insert(identity);
        records.push_back(std::move(record));
    }

    for (const auto& project : projects) {
        const std::string identity = domain::NormalizeProjectIdentity(project.path);
        if (seen.count(identity)) continue;

        auto lastActive = domain::ParseIsoTimestamp(project.lastActive);
        if (!lastActive || !withinWindow(*lastActive, now)) continue;

        domain::ActivityRecord record;
        record.identity = identity;
        record.label = m_labels.resolve(identity);
        record.firstMessage = project.description;
        record.messageCount = 0;
        record.firstTimestamp = *lastActive;
        record.lastTimestamp = *lastActive;
        record.provenance = domain::Provenance::ProjectMetadata;
        record.sessionId = identity;
        record.project = project.path;

        seen.insert(identity);
        records.push_back(std::move(record));
    }

    SortByRecency(records);
    return records;
}

} // namespace missioncontrol::application
