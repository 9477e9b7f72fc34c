/**
 * @file SystemAdapter.hpp
 * @brief Interface implemented once per observed subordinate system.
 */

#pragma once
#include <set>
#include <string>
#include <utility>
#include "SystemStatus.hpp"

namespace missioncontrol::domain {

/**
 * @struct SystemIdentity
 * @brief Presentation fields shared by every status an adapter emits.
 */
struct SystemIdentity {
    std::string id;
    std::string displayName;
    std::string icon;
    std::set<std::string> tags;
};

/**
 * @class SystemAdapter
 * @brief Turns a cheap probe (port or directory presence) plus optional enrichment
 *        into a normalized SystemStatus.
 *
 * Implementations are immutable after construction: describe() may run on a
 * worker thread that outlives the request which started it.
 */
class SystemAdapter {
public:
    explicit SystemAdapter(SystemIdentity identity) : m_identity(std::move(identity)) {}
    virtual ~SystemAdapter() = default;

    const std::string& id() const { return m_identity.id; }

    /**
     * @brief Probes the system and builds its status.
     * Must not throw for unreachable or malformed sources; those become data.
     */
    virtual SystemStatus describe() const = 0;

    /**
     * @brief Status reported when describe() did not answer before the aggregation deadline.
     */
    virtual SystemStatus unresponsive() const {
        SystemStatus status = baseStatus();
        status.state = SystemState::Offline;
        status.detail = "No response before deadline";
        return status;
    }

protected:
    /** @brief A status pre-filled with identity fields. */
    SystemStatus baseStatus() const {
        SystemStatus status;
        status.id = m_identity.id;
        status.displayName = m_identity.displayName;
        status.icon = m_identity.icon;
        status.tags = m_identity.tags;
        return status;
    }

private:
    SystemIdentity m_identity;
};

} // namespace missioncontrol::domain
