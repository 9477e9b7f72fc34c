/**
 * @file MissionControlApp.hpp
 * @brief Main application class for Mission Control.
 */

#pragma once

#include <memory>
#include <httplib.h>
#include "app/HttpRouter.hpp"
#include "application/AppServices.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::app {

/**
 * @class MissionControlApp
 * @brief Orchestrates the service lifecycle: composition, binding, serving and shutdown.
 */
class MissionControlApp {
public:
    explicit MissionControlApp(infrastructure::HubConfig config);

    /**
     * @brief Binds the listen address and serves until Stop() is called.
     * @return Exit code (0 for success).
     */
    int Run();

    /** @brief Asks the server loop to return. Safe to call from another thread. */
    void Stop();

    /** @brief Builds every service from the configuration (composition root). */
    static application::AppServices ComposeServices(const infrastructure::HubConfig& config);

private:
    bool Init();
    void Shutdown();

    const infrastructure::HubConfig m_config;
    application::AppServices m_services;
    std::unique_ptr<HttpRouter> m_router;
    httplib::Server m_server;
};

} // namespace missioncontrol::app
