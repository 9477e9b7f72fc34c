#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "application/SystemRegistry.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/adapters/AdapterFactory.hpp"
#include "infrastructure/adapters/GatewayAdapter.hpp"
#include "infrastructure/adapters/HubAdapter.hpp"
#include "infrastructure/adapters/InferenceServerAdapter.hpp"
#include "infrastructure/adapters/PresenceAdapter.hpp"
#include "infrastructure/adapters/SelfAdapter.hpp"
#include "infrastructure/adapters/ServiceAdapter.hpp"
#include "infrastructure/adapters/WorkerAdapter.hpp"

using namespace missioncontrol;
using namespace missioncontrol::infrastructure;
using namespace missioncontrol::infrastructure::adapters;
using domain::SystemState;
using json = nlohmann::json;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

const milliseconds kProbe(500);
const milliseconds kHealth(1000);

// Free loopback port: bound once, then released.
int UnusedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    ::close(fd);
    return ntohs(addr.sin_port);
}

// Completes TCP handshakes through the backlog but never reads or answers.
int SilentListener(int& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(fd, 16) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port = ntohs(addr.sin_port);
    return fd;
}

AdapterSpec Spec(AdapterKind kind, const std::string& id, int port = 0) {
    AdapterSpec spec;
    spec.kind = kind;
    spec.identity = {id, id + " name", "*", {"test"}};
    spec.port = port;
    return spec;
}

void ExpectWellFormed(const domain::SystemStatus& status) {
    assert(!status.detail.empty());
    const std::string state = domain::StateToString(status.state);
    assert(state == "online" || state == "offline" || state == "installed" || state == "missing");
}

// Serves canned JSON bodies on loopback for the length of a test.
class FakeSubsystem {
public:
    FakeSubsystem() {
        m_port = m_server.bind_to_any_port("127.0.0.1");
        assert(m_port > 0);
    }
    ~FakeSubsystem() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    void serve(const std::string& path, const json& body, int status = 200) {
        m_server.Get(path, [body, status](const httplib::Request&, httplib::Response& res) {
            res.status = status;
            res.set_content(body.dump(), "application/json");
        });
    }

    void start() {
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        while (!m_server.is_running()) std::this_thread::sleep_for(milliseconds(5));
    }

    int port() const { return m_port; }

private:
    httplib::Server m_server;
    int m_port = 0;
    std::thread m_thread;
};

void TestNetworkedAdaptersOffline() {
    const int closed = UnusedPort();

    auto gateway = Spec(AdapterKind::Gateway, "gw", closed);
    auto status = GatewayAdapter(gateway, kProbe).describe();
    assert(status.state == SystemState::Offline && status.detail == "Gateway not running");

    status = HubAdapter(Spec(AdapterKind::Hub, "hub", closed), kProbe, kHealth).describe();
    assert(status.state == SystemState::Offline && status.detail == "Hub not running");

    status = InferenceServerAdapter(Spec(AdapterKind::Inference, "llm", closed), kProbe, kHealth).describe();
    assert(status.state == SystemState::Offline);
    ExpectWellFormed(status);

    status = WorkerAdapter(Spec(AdapterKind::Worker, "worker", closed), kProbe, kHealth).describe();
    assert(status.state == SystemState::Missing);
    assert(status.detail == "Background worker (not running)");
    assert(!status.port && !status.url);

    std::cout << "[PASS] Unreachable systems are offline or missing." << std::endl;
}

void TestHubAndWorkerOnline() {
    FakeSubsystem fake;
    fake.serve("/health", json{{"model", "qwen"}, {"status", "ok"}, {"mode", "auto"}, {"active_tasks", 2},
                               {"completed_today", 5}, {"failed_today", 1}});
    fake.serve("/api/tags", json{{"models", json::array({{{"name", "a"}}, {{"name", "b"}}, {{"name", "c"}},
                                                          {{"name", "d"}}, {{"name", "e"}}})}});
    fake.start();

    auto status = HubAdapter(Spec(AdapterKind::Hub, "hub", fake.port()), kProbe, kHealth).describe();
    assert(status.state == SystemState::Online);
    assert(status.detail == "Model: qwen | ok");

    status = WorkerAdapter(Spec(AdapterKind::Worker, "worker", fake.port()), kProbe, kHealth).describe();
    assert(status.state == SystemState::Online);
    assert(status.detail == "Mode: auto | 2 active, 5 done, 1 failed today");
    assert(status.port && *status.port == fake.port());

    status = InferenceServerAdapter(Spec(AdapterKind::Inference, "llm", fake.port()), kProbe, kHealth).describe();
    assert(status.state == SystemState::Online);
    assert(status.detail == "5 models: a, b, c, d");

    auto service = Spec(AdapterKind::Service, "svc", fake.port());
    status = ServiceAdapter(service, kProbe).describe();
    assert(status.state == SystemState::Online);
    assert(status.detail == "Listening on :" + std::to_string(fake.port()));
    service.onlineDetail = "API up on :{port} ({port})";
    status = ServiceAdapter(service, kProbe).describe();
    const std::string port = std::to_string(fake.port());
    assert(status.detail == "API up on :" + port + " (" + port + ")");

    std::cout << "[PASS] Health payloads enrich online systems." << std::endl;
}

void TestKilledWorkerAndFailedHealth() {
    FakeSubsystem killed;
    killed.serve("/health", json{{"status", "killed"}, {"active_tasks", 3}});
    killed.start();
    auto status = WorkerAdapter(Spec(AdapterKind::Worker, "worker", killed.port()), kProbe, kHealth).describe();
    assert(status.detail == "KILLED | 3 tasks paused");

    FakeSubsystem broken;
    broken.serve("/health", json{{"error", "boom"}}, 500);
    broken.start();
    status = HubAdapter(Spec(AdapterKind::Hub, "hub", broken.port()), kProbe, kHealth).describe();
    // Enrichment failure keeps the probe-derived state.
    assert(status.state == SystemState::Online);
    assert(status.detail == "Port open, health check failed");

    std::cout << "[PASS] Killed worker and failed health check." << std::endl;
}

void TestFilesystemAdapters(const fs::path& root) {
    fs::create_directories(root / "desk" / "journal");
    {
        std::ofstream journal(root / "desk" / "journal" / "journal.jsonl");
        journal << "{}\n\n{}\n   \n{}\n";
    }
    fs::create_directories(root / "exo" / "memory");
    std::ofstream(root / "exo" / "memory" / "one.md") << "x";
    std::ofstream(root / "exo" / "memory" / "two.MD") << "x";
    std::ofstream(root / "exo" / "memory" / "skip.txt") << "x";

    auto desk = Spec(AdapterKind::Presence, "desk");
    desk.directory = root / "desk";
    desk.journalFile = root / "desk" / "journal" / "journal.jsonl";
    desk.detailTemplate = "{count} journal entries";
    auto status = PresenceAdapter(desk).describe();
    assert(status.state == SystemState::Installed);
    assert(status.detail == "3 journal entries");

    auto memory = Spec(AdapterKind::Presence, "memory");
    memory.directory = root / "exo";
    memory.countDirectory = root / "exo" / "memory";
    memory.countExtension = ".md";
    memory.detailTemplate = "{count} memory files";
    status = PresenceAdapter(memory).describe();
    assert(status.detail == "2 memory files");

    auto absent = Spec(AdapterKind::Presence, "absent");
    absent.directory = root / "nowhere";
    absent.description = "Not installed here";
    status = PresenceAdapter(absent).describe();
    assert(status.state == SystemState::Missing);
    assert(status.detail == "Not installed here");
    assert(PresenceAdapter(absent).unresponsive().state == SystemState::Missing);

    auto service = Spec(AdapterKind::Service, "svc", UnusedPort());
    service.directory = root / "desk";
    status = ServiceAdapter(service, kProbe).describe();
    assert(status.state == SystemState::Installed);
    ExpectWellFormed(status);

    auto self = Spec(AdapterKind::Self, "self");
    status = SelfAdapter(self, 8090).describe();
    assert(status.state == SystemState::Online);
    assert(status.port && *status.port == 8090);
    assert(status.url && *status.url == "http://localhost:8090");

    std::cout << "[PASS] Filesystem-only adapters." << std::endl;
}

void TestGatewayConfig(const fs::path& root) {
    FakeSubsystem gatewayPort;
    gatewayPort.start();

    const fs::path configFile = root / "gateway.json";
    {
        json cfg = {
            {"agents", {{"defaults", {{"model", {{"primary", "ollama/qwen2.5:14b"}}}}}}},
            {"plugins", {{"entries", {{"telegram", {{"enabled", true}}},
                                      {"browser", {{"enabled", false}}},
                                      {"memory", {{"enabled", true}}}}}}}
        };
        std::ofstream(configFile) << cfg.dump();
    }

    auto spec = Spec(AdapterKind::Gateway, "gw", gatewayPort.port());
    spec.configFile = configFile;
    auto status = GatewayAdapter(spec, kProbe).describe();
    assert(status.state == SystemState::Online);
    assert(status.detail == "Model: qwen2.5:14b | 2 plugins");

    std::ofstream(configFile) << "{ truncated";
    status = GatewayAdapter(spec, kProbe).describe();
    assert(status.state == SystemState::Online);
    assert(status.detail == "Gateway online, config unreadable");

    std::cout << "[PASS] Gateway reads its config when reachable." << std::endl;
}

class StalledAdapter : public domain::SystemAdapter {
public:
    explicit StalledAdapter(milliseconds delay) : SystemAdapter({"stalled", "Stalled", "", {}}), m_delay(delay) {}
    domain::SystemStatus describe() const override {
        std::this_thread::sleep_for(m_delay);
        auto status = baseStatus();
        status.state = SystemState::Online;
        status.detail = "late";
        return status;
    }

private:
    milliseconds m_delay;
};

class OddlyThrowingAdapter : public domain::SystemAdapter {
public:
    OddlyThrowingAdapter() : SystemAdapter({"odd", "Odd", "", {}}) {}
    domain::SystemStatus describe() const override { throw 42; }
};

class ThrowingAdapter : public domain::SystemAdapter {
public:
    ThrowingAdapter() : SystemAdapter({"throwing", "Throwing", "", {}}) {}
    domain::SystemStatus describe() const override { throw std::runtime_error("adapter bug"); }
};

void TestRegistry() {
    auto first = Spec(AdapterKind::Self, "first");
    auto last = Spec(AdapterKind::Self, "last");

    std::vector<std::shared_ptr<domain::SystemAdapter>> adapters = {
        std::make_shared<SelfAdapter>(first, 9000),
        std::make_shared<StalledAdapter>(milliseconds(3000)),
        std::make_shared<ThrowingAdapter>(),
        std::make_shared<OddlyThrowingAdapter>(),
        std::make_shared<SelfAdapter>(last, 9000),
    };
    application::SystemRegistry registry(adapters, milliseconds(300));
    assert(registry.size() == 5);

    auto start = steady_clock::now();
    auto statuses = registry.aggregate();
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    assert(statuses.size() == 5);
    assert(statuses[0].id == "first" && statuses[0].state == SystemState::Online);
    assert(statuses[1].id == "stalled" && statuses[1].state == SystemState::Offline);
    assert(statuses[1].detail == "No response before deadline");
    assert(statuses[2].id == "throwing" && statuses[2].state == SystemState::Offline);
    assert(statuses[3].id == "odd" && statuses[3].state == SystemState::Offline);
    assert(statuses[4].id == "last" && statuses[4].state == SystemState::Online);
    for (const auto& status : statuses) ExpectWellFormed(status);
    assert(elapsed < milliseconds(1000));

    std::cout << "[PASS] Registry keeps order and honors its deadline (" << elapsed.count() << "ms)." << std::endl;
}

void TestHangingHealthUnderDefaultTimeouts() {
    int port = 0;
    int listener = SilentListener(port);

    HubConfig config = ConfigLoader::Defaults();
    const auto enrichment = AdapterFactory::EnrichmentBudget(config);
    assert(enrichment < config.budgets.health);
    assert(config.probeTimeout + enrichment + kDeadlineMargin <= config.aggregationDeadline);

    config.systems = {Spec(AdapterKind::Hub, "hub", port), Spec(AdapterKind::Worker, "worker", port)};
    application::SystemRegistry registry(AdapterFactory::CreateAll(config), config.aggregationDeadline);

    auto start = steady_clock::now();
    auto statuses = registry.aggregate();
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    // The port is open, so a health call that never answers must not read as offline.
    assert(statuses.size() == 2);
    for (const auto& status : statuses) {
        assert(status.state == SystemState::Online);
        assert(status.detail == "Port open, health check failed");
    }
    assert(elapsed < config.aggregationDeadline);

    ::close(listener);
    std::cout << "[PASS] Hanging health check stays online within the deadline (" << elapsed.count() << "ms)."
              << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Adapter Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "mission_control_adapter_test";
    fs::remove_all(root);
    fs::create_directories(root);

    TestNetworkedAdaptersOffline();
    TestHubAndWorkerOnline();
    TestKilledWorkerAndFailedHealth();
    TestFilesystemAdapters(root);
    TestGatewayConfig(root);
    TestRegistry();
    TestHangingHealthUnderDefaultTimeouts();

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
