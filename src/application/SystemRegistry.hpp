/**
 * @file SystemRegistry.hpp
 * @brief Ordered list of adapters and the concurrent aggregation over them.
 */

#pragma once

#include <chrono>
#include <memory>
#include <vector>
#include "domain/SystemAdapter.hpp"

namespace missioncontrol::application {

/**
 * @class SystemRegistry
 * @brief Fans out one describe() per adapter and joins them against a single deadline.
 *
 * Every adapter runs on its own detached worker, so a pass takes as long as the
 * slowest adapter, capped by the deadline. Adapters that have not answered by then
 * are reported through SystemAdapter::unresponsive(). Results always come back in
 * registration order.
 */
class SystemRegistry {
public:
    SystemRegistry(std::vector<std::shared_ptr<domain::SystemAdapter>> adapters, std::chrono::milliseconds deadline);

    /** @brief One status per adapter, in registration order. Never throws for adapter failures. */
    std::vector<domain::SystemStatus> aggregate() const;

    size_t size() const { return m_adapters.size(); }

private:
    std::vector<std::shared_ptr<const domain::SystemAdapter>> m_adapters;
    std::chrono::milliseconds m_deadline;
};

} // namespace missioncontrol::application
