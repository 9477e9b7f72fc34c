#include "app/HttpRouter.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include "infrastructure/ProxyRoutes.hpp"

namespace missioncontrol::app {

using json = nlohmann::json;

namespace {

constexpr const char* kJson = "application/json";

void SendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), kJson);
}

void SendProxyResult(httplib::Response& res, const infrastructure::ProxyResult& result) {
    SendJson(res, result.body, result.status);
}

void SendBadRequest(httplib::Response& res, const std::string& reason) {
    SendJson(res, json{{"ok", false}, {"error", reason}}, 400);
}

// Upstreams always receive a JSON document; a missing or unparsable body becomes {}.
std::string PassThroughBody(const std::string& body) {
    if (body.empty() || !json::accept(body)) return "{}";
    return body;
}

// Parses a request body that must be a JSON object; answers 400 otherwise.
std::optional<json> ParseObjectBody(const httplib::Request& req, httplib::Response& res) {
    try {
        json body = json::parse(req.body.empty() ? std::string("{}") : req.body);
        if (!body.is_object()) {
            SendBadRequest(res, "Request body must be a JSON object");
            return std::nullopt;
        }
        return body;
    } catch (const json::parse_error& e) {
        SendBadRequest(res, e.what());
    }
    return std::nullopt;
}

} // namespace

HttpRouter::HttpRouter(const application::AppServices& services, const infrastructure::HubConfig& config)
    : m_services(services), m_config(config) {}

void HttpRouter::Register(httplib::Server& server) const {
    server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        // Handlers that already produced a body (400s, bridged 404s) keep it.
        if (!res.body.empty()) return;
        if (res.status == 404) {
            SendJson(res, json{{"error", "Not found"}}, res.status);
        } else {
            SendJson(res, json{{"error", "Request failed"}, {"detail", "HTTP " + std::to_string(res.status)}},
                     res.status);
        }
    });

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string detail = "Unknown exception";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            detail = e.what();
        } catch (...) {
            // Non-standard exception type; reported with the generic detail.
        }
        std::cerr << "[HttpRouter] " << req.method << " " << req.path << " failed: " << detail << std::endl;
        SendJson(res, json{{"error", "Internal error"}, {"detail", detail}}, 500);
    });

    registerCoreRoutes(server);
    registerGatewayRoutes(server);
    registerBridgeRoutes(server);
}

void HttpRouter::registerCoreRoutes(httplib::Server& server) const {
    const auto& services = m_services;

    server.Get("/api/systems", [&services](const httplib::Request&, httplib::Response& res) {
        SendJson(res, json(services.systemRegistry->aggregate()));
    });

    server.Get("/api/active-sessions", [&services](const httplib::Request&, httplib::Response& res) {
        SendJson(res, json(services.activityService->activeSessions(std::chrono::system_clock::now())));
    });

    server.Get("/api/sessions", [&services](const httplib::Request&, httplib::Response& res) {
        SendJson(res, json(services.activityService->sessionSummaries()));
    });

    server.Get("/api/projects", [&services](const httplib::Request&, httplib::Response& res) {
        SendJson(res, services.activityService->registryDocument());
    });

    server.Get("/api/stats", [&services](const httplib::Request&, httplib::Response& res) {
        auto stats = application::ProjectService::Stats(services.activityService->projects(),
                                                        services.activityService->sessionSummaries());
        SendJson(res, json(stats));
    });

    server.Get("/api/scan", [&services](const httplib::Request&, httplib::Response& res) {
        auto found = services.projectService->scanForUnregistered(services.activityService->projects());
        SendJson(res, json{{"new_projects", found}});
    });

    server.Get("/api/disk", [&services](const httplib::Request&, httplib::Response& res) {
        auto usage = services.projectService->diskUsage();
        SendJson(res, usage ? json(*usage) : json(nullptr));
    });
}

void HttpRouter::registerGatewayRoutes(httplib::Server& server) const {
    const auto& services = m_services;
    const auto& config = m_config;

    server.Get("/api/gateway/health", [&services, &config](const httplib::Request&, httplib::Response& res) {
        SendJson(res, services.gatewayActivity->health(config.probeTimeout));
    });

    server.Get("/api/gateway/activity", [&services](const httplib::Request&, httplib::Response& res) {
        auto today = infrastructure::GatewayActivityReader::LocalDate(std::chrono::system_clock::now());
        SendJson(res, services.gatewayActivity->activity(today));
    });

    server.Post("/api/gateway/send", [&services, &config](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseObjectBody(req, res);
        if (!body) return;

        std::string message;
        if (body->contains("message") && (*body)["message"].is_string()) {
            message = (*body)["message"].get<std::string>();
        }
        if (message.empty()) {
            SendJson(res, json{{"error", "message required"}}, 400);
            return;
        }

        auto request = infrastructure::ProxyRoutes::ChatCompletionRequest(config.gateway.chatModel, message);
        SendProxyResult(res, services.gatewayBridge->send("POST", "/v1/chat/completions", request.dump(),
                                                          domain::CallClass::Dispatch));
    });
}

void HttpRouter::registerBridgeRoutes(httplib::Server& server) const {
    const auto& services = m_services;

    server.Post("/api/hub/dispatch", [&services](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseObjectBody(req, res);
        if (!body) return;

        const std::string endpoint = infrastructure::ProxyRoutes::TakeDispatchEndpoint(*body);
        SendProxyResult(res, services.hubBridge->send("POST", endpoint, body->dump(), domain::CallClass::Dispatch));
    });

    auto mount = [&server](const std::string& prefix, std::shared_ptr<infrastructure::ProxyBridge> bridge) {
        const std::string pattern = prefix + "(/.*)?";
        server.Get(pattern, [bridge](const httplib::Request& req, httplib::Response& res) {
            SendProxyResult(res, bridge->forward("GET", req.target, ""));
        });
        server.Post(pattern, [bridge](const httplib::Request& req, httplib::Response& res) {
            SendProxyResult(res, bridge->forward("POST", req.target, PassThroughBody(req.body)));
        });
    };

    mount(infrastructure::ProxyRoutes::kHubPrefix, services.hubBridge);
    mount(infrastructure::ProxyRoutes::kWorkerPrefix, services.workerBridge);
}

} // namespace missioncontrol::app
