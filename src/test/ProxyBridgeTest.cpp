#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ProxyBridge.hpp"
#include "infrastructure/ProxyRoutes.hpp"

using namespace missioncontrol;
using namespace missioncontrol::infrastructure;
using json = nlohmann::json;
using namespace std::chrono;

namespace {

domain::RewriteRule Rule(const std::string& method, domain::MatchKind match, const std::string& inbound,
                         const std::string& upstream, domain::CallClass callClass = domain::CallClass::Standard) {
    domain::RewriteRule rule;
    rule.method = method;
    rule.match = match;
    rule.inbound = inbound;
    rule.upstream = upstream;
    rule.callClass = callClass;
    return rule;
}

void StartUpstream(httplib::Server& svr, int& port, std::thread& thread) {
    svr.Get("/api/tasks", [](const httplib::Request& req, httplib::Response& res) {
        json body = {{"path", req.path}, {"status", req.get_param_value("status")}};
        res.set_content(body.dump(), "application/json");
    });
    svr.Get(R"(/tasks/(\d+))", [](const httplib::Request& req, httplib::Response& res) {
        res.set_content(json{{"id", req.matches[1].str()}}.dump(), "application/json");
    });
    svr.Get("/fail", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
        res.set_content(std::string(800, 'e'), "text/plain");
    });
    svr.Get("/text", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("definitely not json", "text/plain");
    });
    svr.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(milliseconds(1500));
        res.set_content("{}", "application/json");
    });
    svr.Post(R"(/tasks/(\d+)/run)", [](const httplib::Request& req, httplib::Response& res) {
        json body = {
            {"id", req.matches[1].str()},
            {"auth", req.get_header_value("Authorization")},
            {"accept", req.get_header_value("Accept")},
            {"received", json::parse(req.body)}
        };
        res.set_content(body.dump(), "application/json");
    });

    port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    thread = std::thread([&svr]() { svr.listen_after_bind(); });
    while (!svr.is_running()) {
        std::this_thread::sleep_for(milliseconds(5));
    }
}

domain::ProxyTarget BridgeTarget(int port) {
    using domain::MatchKind;
    domain::ProxyTarget target;
    target.name = "upstream";
    target.port = port;
    target.bearerToken = "secret-token";

    auto tasks = Rule("GET", MatchKind::Prefix, "/bridge/tasks", "/api/tasks");
    tasks.singleResourceUpstream = "/tasks";
    target.rules.push_back(tasks);

    auto run = Rule("POST", MatchKind::Prefix, "/bridge/tasks", "/tasks", domain::CallClass::Action);
    run.suffix = "/run";
    target.rules.push_back(run);

    target.rules.push_back(Rule("GET", MatchKind::Exact, "/bridge/fail", "/fail"));
    target.rules.push_back(Rule("GET", MatchKind::Exact, "/bridge/text", "/text"));
    target.rules.push_back(Rule("GET", MatchKind::Exact, "/bridge/slow", "/slow", domain::CallClass::Health));
    return target;
}

void TestRewrite(const ProxyBridge& bridge) {
    auto call = bridge.rewrite("GET", "/bridge/tasks?status=queued");
    assert(call && call->path == "/api/tasks?status=queued");

    call = bridge.rewrite("GET", "/bridge/tasks/42");
    assert(call && call->path == "/tasks/42");

    // With a query the collection namespace is kept.
    call = bridge.rewrite("GET", "/bridge/tasks/42?verbose=1");
    assert(call && call->path == "/api/tasks/42?verbose=1");

    call = bridge.rewrite("POST", "/bridge/tasks/7/run");
    assert(call && call->path == "/tasks/7/run");
    assert(call->callClass == domain::CallClass::Action);

    assert(!bridge.rewrite("GET", "/bridge/tasksX"));
    assert(!bridge.rewrite("POST", "/bridge/tasks/7/cancel"));
    assert(!bridge.rewrite("DELETE", "/bridge/tasks"));

    std::cout << "[PASS] Rewrite rules." << std::endl;
}

void TestForward(const ProxyBridge& bridge) {
    auto result = bridge.forward("GET", "/bridge/tasks?status=queued", "");
    assert(result.ok && result.status == 200);
    assert(result.body["path"] == "/api/tasks");
    assert(result.body["status"] == "queued");

    result = bridge.forward("GET", "/bridge/tasks/42", "");
    assert(result.ok && result.body["id"] == "42");

    result = bridge.forward("POST", "/bridge/tasks/7/run", "{\"priority\":1}");
    assert(result.ok);
    assert(result.body["auth"] == "Bearer secret-token");
    assert(result.body["accept"] == "application/json");
    assert(result.body["received"]["priority"] == 1);

    result = bridge.forward("GET", "/bridge/missing", "");
    assert(!result.ok && result.status == 404);

    std::cout << "[PASS] Forwarding preserves query, headers and body." << std::endl;
}

void TestErrors(const ProxyBridge& bridge) {
    auto result = bridge.forward("GET", "/bridge/fail", "");
    assert(!result.ok && result.status == 200);
    assert(result.body["error"] == "HTTP 503");
    assert(result.body["detail"].get<std::string>().size() == domain::ErrorEnvelope::kMaxDetailLength);

    result = bridge.forward("GET", "/bridge/text", "");
    assert(!result.ok);
    assert(!result.body["error"].get<std::string>().empty());
    assert(!result.body.contains("detail"));

    auto start = steady_clock::now();
    result = bridge.forward("GET", "/bridge/slow", "");
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
    assert(!result.ok);
    assert(result.body.contains("error"));
    assert(elapsed < milliseconds(1200));
    std::cout << "[PASS] Timed-out call answered in " << elapsed.count() << "ms." << std::endl;

    domain::ProxyTarget closed;
    closed.name = "closed";
    closed.port = 1;
    ProxyBridge nowhere(closed, domain::TimeoutBudgets{});
    result = nowhere.send("GET", "/health", "", domain::CallClass::Health);
    assert(!result.ok && result.body.contains("error"));

    std::cout << "[PASS] Upstream failures become error envelopes." << std::endl;
}

void TestDefaultRoutes() {
    HubConfig config = ConfigLoader::Defaults();
    ProxyBridge hub(ProxyRoutes::HubTarget(config), config.budgets);
    ProxyBridge worker(ProxyRoutes::WorkerTarget(config), config.budgets);

    assert(hub.rewrite("GET", "/api/hub/health")->path == "/health");
    assert(hub.rewrite("GET", "/api/hub/health")->callClass == domain::CallClass::Health);
    assert(hub.rewrite("GET", "/api/hub/capabilities")->path == "/api/capabilities");
    assert(hub.rewrite("GET", "/api/hub/tasks?limit=20")->path == "/api/tasks?limit=20");
    assert(hub.rewrite("GET", "/api/hub/tasks/12")->path == "/tasks/12");
    assert(hub.rewrite("POST", "/api/hub/tasks/12/run")->path == "/tasks/12/run");
    assert(hub.rewrite("POST", "/api/hub/tasks/12/approve")->path == "/api/tasks/12/approve");
    assert(hub.rewrite("POST", "/api/hub/tasks/12/handoff")->path == "/api/tasks/12/handoff");

    assert(worker.rewrite("GET", "/api/worker/status")->path == "/api/status");
    assert(worker.rewrite("GET", "/api/worker/tasks?status=awaiting_review")->path ==
           "/api/tasks?status=awaiting_review");
    assert(worker.rewrite("GET", "/api/worker/journal")->path == "/api/journal?n=20");
    assert(worker.rewrite("POST", "/api/worker/tasks/approve-all")->path == "/api/tasks/approve-all");
    assert(worker.rewrite("POST", "/api/worker/tasks/9/approve")->path == "/api/tasks/9/approve");
    assert(worker.rewrite("POST", "/api/worker/tasks/9/reject")->path == "/api/tasks/9/reject");
    assert(worker.rewrite("POST", "/api/worker/kill")->path == "/api/kill");
    assert(worker.rewrite("POST", "/api/worker/resume")->path == "/api/resume");

    json sync = {{"prompt", "x"}};
    assert(ProxyRoutes::TakeDispatchEndpoint(sync) == "/run");
    json async = {{"prompt", "x"}, {"mode", "queue"}};
    assert(ProxyRoutes::TakeDispatchEndpoint(async) == "/tasks");
    assert(!async.contains("mode"));

    std::cout << "[PASS] Default hub and worker routes." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ProxyBridge Test..." << std::endl;

    httplib::Server upstream;
    int port = 0;
    std::thread serverThread;
    StartUpstream(upstream, port, serverThread);

    domain::TimeoutBudgets budgets;
    budgets.health = milliseconds(300);
    budgets.standard = milliseconds(2000);
    ProxyBridge bridge(BridgeTarget(port), budgets);

    TestRewrite(bridge);
    TestForward(bridge);
    TestErrors(bridge);
    TestDefaultRoutes();

    upstream.stop();
    serverThread.join();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
