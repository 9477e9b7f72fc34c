#include "infrastructure/adapters/AdapterFactory.hpp"
#include "infrastructure/adapters/GatewayAdapter.hpp"
#include "infrastructure/adapters/HubAdapter.hpp"
#include "infrastructure/adapters/InferenceServerAdapter.hpp"
#include "infrastructure/adapters/PresenceAdapter.hpp"
#include "infrastructure/adapters/SelfAdapter.hpp"
#include "infrastructure/adapters/ServiceAdapter.hpp"
#include "infrastructure/adapters/WorkerAdapter.hpp"

#include <algorithm>

namespace missioncontrol::infrastructure::adapters {

std::chrono::milliseconds AdapterFactory::EnrichmentBudget(const HubConfig& config) {
    const auto room = config.aggregationDeadline - config.probeTimeout - kDeadlineMargin;
    return std::min(config.budgets.health, std::max(room, kMinEnrichment));
}

std::shared_ptr<domain::SystemAdapter> AdapterFactory::Create(const AdapterSpec& spec, const HubConfig& config) {
    const auto probe = config.probeTimeout;
    const auto health = EnrichmentBudget(config);

    switch (spec.kind) {
        case AdapterKind::Gateway: return std::make_shared<GatewayAdapter>(spec, probe);
        case AdapterKind::Hub: return std::make_shared<HubAdapter>(spec, probe, health);
        case AdapterKind::Inference: return std::make_shared<InferenceServerAdapter>(spec, probe, health);
        case AdapterKind::Presence: return std::make_shared<PresenceAdapter>(spec);
        case AdapterKind::Service: return std::make_shared<ServiceAdapter>(spec, probe);
        case AdapterKind::Worker: return std::make_shared<WorkerAdapter>(spec, probe, health);
        case AdapterKind::Self: return std::make_shared<SelfAdapter>(spec, config.port);
    }
    return std::make_shared<ServiceAdapter>(spec, probe);
}

std::vector<std::shared_ptr<domain::SystemAdapter>> AdapterFactory::CreateAll(const HubConfig& config) {
    std::vector<std::shared_ptr<domain::SystemAdapter>> adapters;
    adapters.reserve(config.systems.size());
    for (const auto& spec : config.systems) {
        adapters.push_back(Create(spec, config));
    }
    return adapters;
}

} // namespace missioncontrol::infrastructure::adapters
