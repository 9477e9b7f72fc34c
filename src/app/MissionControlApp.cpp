/**
 * @file MissionControlApp.cpp
 * @brief Implementation of the MissionControlApp class.
 */
#include "app/MissionControlApp.hpp"

#include <iostream>
#include <utility>
#include "application/ActivityReconciler.hpp"
#include "infrastructure/ProxyRoutes.hpp"
#include "infrastructure/adapters/AdapterFactory.hpp"

namespace missioncontrol::app {

MissionControlApp::MissionControlApp(infrastructure::HubConfig config)
    : m_config(std::move(config)) {}

application::AppServices MissionControlApp::ComposeServices(const infrastructure::HubConfig& config) {
    application::AppServices services;

    services.systemRegistry = std::make_unique<application::SystemRegistry>(
        infrastructure::adapters::AdapterFactory::CreateAll(config), config.aggregationDeadline);

    services.activityService = std::make_unique<application::ActivityService>(
        infrastructure::SessionLogReader(config.sessionLog),
        infrastructure::ProjectRegistryStore(config.projectsFile),
        application::ActivityReconciler(config.labels, config.recencyWindow));

    services.projectService = std::make_unique<application::ProjectService>(config.projectsRoot,
                                                                             config.selfDirectoryName);
    services.gatewayActivity = std::make_unique<infrastructure::GatewayActivityReader>(config.gateway);

    services.hubBridge = std::make_shared<infrastructure::ProxyBridge>(
        infrastructure::ProxyRoutes::HubTarget(config), config.budgets);
    services.workerBridge = std::make_shared<infrastructure::ProxyBridge>(
        infrastructure::ProxyRoutes::WorkerTarget(config), config.budgets);
    services.gatewayBridge = std::make_shared<infrastructure::ProxyBridge>(
        infrastructure::ProxyRoutes::GatewayTarget(config), config.budgets);

    return services;
}

bool MissionControlApp::Init() {
    // Dependency Injection / Composition Root
    m_services = ComposeServices(m_config);
    std::cout << "[MissionControlApp] Observing " << m_services.systemRegistry->size() << " systems." << std::endl;

    m_router = std::make_unique<HttpRouter>(m_services, m_config);
    m_router->Register(m_server);

    if (!m_server.bind_to_port(m_config.listenHost, m_config.port)) {
        std::cerr << "[MissionControlApp] Failed to bind " << m_config.listenHost << ":" << m_config.port
                  << std::endl;
        return false;
    }
    return true;
}

void MissionControlApp::Shutdown() {
    if (m_server.is_running()) {
        m_server.stop();
    }
    std::cout << "[MissionControlApp] Shutdown complete." << std::endl;
}

void MissionControlApp::Stop() {
    m_server.stop();
}

int MissionControlApp::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    std::cout << "[MissionControlApp] Mission Control listening on http://" << m_config.listenHost << ":"
              << m_config.port << std::endl;
    std::cout << "[MissionControlApp] Projects root: " << m_config.projectsRoot.string() << std::endl;

    if (!m_server.listen_after_bind()) {
        std::cerr << "[MissionControlApp] Server loop ended with an error." << std::endl;
        Shutdown();
        return 1;
    }

    Shutdown();
    return 0;
}

} // namespace missioncontrol::app
