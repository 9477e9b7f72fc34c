#include "infrastructure/ProxyRoutes.hpp"

namespace missioncontrol::infrastructure {

using domain::CallClass;
using domain::MatchKind;
using domain::RewriteRule;

namespace {

RewriteRule Exact(const std::string& method, const std::string& inbound, const std::string& upstream,
                  CallClass callClass = CallClass::Standard) {
    RewriteRule rule;
    rule.method = method;
    rule.match = MatchKind::Exact;
    rule.inbound = inbound;
    rule.upstream = upstream;
    rule.callClass = callClass;
    return rule;
}

RewriteRule Prefix(const std::string& method, const std::string& inbound, const std::string& upstream,
                   CallClass callClass = CallClass::Standard, const std::string& suffix = "") {
    RewriteRule rule;
    rule.method = method;
    rule.match = MatchKind::Prefix;
    rule.inbound = inbound;
    rule.upstream = upstream;
    rule.suffix = suffix;
    rule.callClass = callClass;
    return rule;
}

} // namespace

domain::ProxyTarget ProxyRoutes::HubTarget(const HubConfig& config) {
    const std::string p = kHubPrefix;

    domain::ProxyTarget target;
    target.name = "hub";
    target.host = config.hub.host;
    target.port = config.hub.port;

    target.rules.push_back(Exact("GET", p + "/health", "/health", CallClass::Health));
    target.rules.push_back(Exact("GET", p + "/capabilities", "/api/capabilities"));

    // Collection queries live under /api/tasks, a single task under /tasks/<id>.
    RewriteRule tasks = Prefix("GET", p + "/tasks", "/api/tasks");
    tasks.singleResourceUpstream = "/tasks";
    target.rules.push_back(tasks);

    target.rules.push_back(Prefix("POST", p + "/tasks", "/tasks", CallClass::Dispatch, "/run"));
    target.rules.push_back(Prefix("POST", p + "/tasks", "/api/tasks", CallClass::Action, "/approve"));
    target.rules.push_back(Prefix("POST", p + "/tasks", "/api/tasks", CallClass::Action, "/handoff"));
    return target;
}

domain::ProxyTarget ProxyRoutes::WorkerTarget(const HubConfig& config) {
    const std::string p = kWorkerPrefix;

    domain::ProxyTarget target;
    target.name = "worker";
    target.host = config.worker.host;
    target.port = config.worker.port;

    target.rules.push_back(Exact("GET", p + "/health", "/health", CallClass::Health));
    target.rules.push_back(Exact("GET", p + "/status", "/api/status"));
    target.rules.push_back(Prefix("GET", p + "/tasks", "/api/tasks"));
    target.rules.push_back(Exact("GET", p + "/knowledge", "/api/knowledge"));
    target.rules.push_back(Exact("GET", p + "/journal", "/api/journal?n=20"));

    target.rules.push_back(Exact("POST", p + "/tasks/approve-all", "/api/tasks/approve-all", CallClass::Action));
    target.rules.push_back(Prefix("POST", p + "/tasks", "/api/tasks", CallClass::Action, "/approve"));
    target.rules.push_back(Prefix("POST", p + "/tasks", "/api/tasks", CallClass::Action, "/reject"));
    target.rules.push_back(Exact("POST", p + "/kill", "/api/kill", CallClass::Action));
    target.rules.push_back(Exact("POST", p + "/resume", "/api/resume", CallClass::Action));
    return target;
}

domain::ProxyTarget ProxyRoutes::GatewayTarget(const HubConfig& config) {
    domain::ProxyTarget target;
    target.name = "gateway";
    target.host = config.gateway.endpoint.host;
    target.port = config.gateway.endpoint.port;
    target.bearerToken = config.gateway.token;
    return target;
}

std::string ProxyRoutes::TakeDispatchEndpoint(nlohmann::json& request) {
    std::string mode = "sync";
    if (request.contains("mode")) {
        if (request["mode"].is_string()) mode = request["mode"].get<std::string>();
        request.erase("mode");
    }
    return mode == "sync" ? "/run" : "/tasks";
}

nlohmann::json ProxyRoutes::ChatCompletionRequest(const std::string& model, const std::string& message) {
    return nlohmann::json{
        {"model", model},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", message}}})},
        {"stream", false}
    };
}

} // namespace missioncontrol::infrastructure
