/**
 * @file AdapterFactory.hpp
 * @brief Builds the ordered adapter list from the configuration.
 */

#pragma once
#include <chrono>
#include <memory>
#include <vector>
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

class AdapterFactory {
public:
    /**
     * @brief Timeout for an adapter's health call.
     *
     * A reachable system is probed first and enriched second; both must land before
     * the aggregation deadline, so the health budget is capped at
     * `deadline - probeTimeout - kDeadlineMargin`.
     */
    static std::chrono::milliseconds EnrichmentBudget(const HubConfig& config);

    static std::shared_ptr<domain::SystemAdapter> Create(const AdapterSpec& spec, const HubConfig& config);

    /** @brief One adapter per configured system, in configuration order. */
    static std::vector<std::shared_ptr<domain::SystemAdapter>> CreateAll(const HubConfig& config);
};

} // namespace missioncontrol::infrastructure::adapters
