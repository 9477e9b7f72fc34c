/**
 * @file HttpRouter.hpp
 * @brief Maps the HTTP surface onto the application services.
 */

#pragma once

#include <httplib.h>
#include "application/AppServices.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::app {

/**
 * @class HttpRouter
 * @brief Registers every route on an httplib::Server. Holds no business logic.
 *
 * Unmatched paths answer 404 `{"error":"Not found"}`; a handler that throws
 * answers 500 with an error envelope. Both services and config must outlive
 * the server.
 */
class HttpRouter {
public:
    HttpRouter(const application::AppServices& services, const infrastructure::HubConfig& config);

    void Register(httplib::Server& server) const;

private:
    void registerCoreRoutes(httplib::Server& server) const;
    void registerGatewayRoutes(httplib::Server& server) const;
    void registerBridgeRoutes(httplib::Server& server) const;

    const application::AppServices& m_services;
    const infrastructure::HubConfig& m_config;
};

} // namespace missioncontrol::app
