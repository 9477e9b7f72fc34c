/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ActivityService.hpp"
#include "application/ProjectService.hpp"
#include "application/SystemRegistry.hpp"
#include "infrastructure/GatewayActivityReader.hpp"
#include "infrastructure/ProxyBridge.hpp"

namespace missioncontrol::application {

struct AppServices {
    std::unique_ptr<SystemRegistry> systemRegistry;
    std::unique_ptr<ActivityService> activityService;
    std::unique_ptr<ProjectService> projectService;
    std::unique_ptr<infrastructure::GatewayActivityReader> gatewayActivity;
    std::shared_ptr<infrastructure::ProxyBridge> hubBridge;
    std::shared_ptr<infrastructure::ProxyBridge> workerBridge;
    std::shared_ptr<infrastructure::ProxyBridge> gatewayBridge;
};

} // namespace missioncontrol::application
