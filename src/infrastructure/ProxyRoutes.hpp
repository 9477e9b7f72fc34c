/**
 * @file ProxyRoutes.hpp
 * @brief The bridged namespaces and their rewrite tables.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/ProxyTarget.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure {

class ProxyRoutes {
public:
    static constexpr const char* kHubPrefix = "/api/hub";
    static constexpr const char* kWorkerPrefix = "/api/worker";

    /** @brief Task-dispatch hub under /api/hub. */
    static domain::ProxyTarget HubTarget(const HubConfig& config);

    /** @brief Background worker under /api/worker. */
    static domain::ProxyTarget WorkerTarget(const HubConfig& config);

    /** @brief Agent gateway; no rules, used through ProxyBridge::send only. */
    static domain::ProxyTarget GatewayTarget(const HubConfig& config);

    /**
     * @brief Picks the hub endpoint for a dispatch request and strips `mode` from it.
     * @return "/run" for mode "sync" (the default), "/tasks" otherwise.
     */
    static std::string TakeDispatchEndpoint(nlohmann::json& request);

    /** @brief OpenAI-style chat completion body for the gateway. */
    static nlohmann::json ChatCompletionRequest(const std::string& model, const std::string& message);
};

} // namespace missioncontrol::infrastructure
