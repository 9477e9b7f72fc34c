#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using namespace missioncontrol::infrastructure;
using json = nlohmann::json;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

void TestMissingFile(const fs::path& dir) {
    HubConfig config = ConfigLoader::Load(dir / "does-not-exist.json");
    assert(config.port == 8090);
    assert(config.listenHost == "127.0.0.1");
    assert(config.systems.size() == 8);
    assert(config.aggregationDeadline == milliseconds(2500));
    assert(config.recencyWindow == hours(48));
    assert(config.systems.back().kind == AdapterKind::Self);
    std::cout << "[PASS] Missing settings fall back to defaults." << std::endl;
}

void TestPartialOverride(const fs::path& dir) {
    const fs::path file = dir / "partial.json";
    json j = {
        {"port", 9100},
        {"projectsRoot", (dir / "projects").string()},
        {"timeouts", {{"deadlineMs", 1600}, {"healthMs", 150}}},
        {"hub", {{"port", 8102}}},
        {"labels", json::array({{{"match", "acme"}, {"label", "Acme Portal"}}})}
    };
    std::ofstream(file) << j.dump(2);

    HubConfig config = ConfigLoader::Load(file);
    assert(config.port == 9100);
    assert(config.projectsRoot == dir / "projects");
    assert(config.projectsFile == dir / "projects" / "PROJECTS.json");
    assert(config.aggregationDeadline == milliseconds(1600));
    assert(config.budgets.health == milliseconds(150));
    // Untouched keys keep their defaults.
    assert(config.probeTimeout == milliseconds(1000));
    assert(config.budgets.dispatch == milliseconds(300000));
    assert(config.hub.host == "127.0.0.1" && config.hub.port == 8102);
    assert(config.worker.port == 8095);

    assert(config.labels.resolve("acme-web") == "Acme Portal");
    // Message rules stay at their defaults when only identity rules are given.
    assert(config.labels.resolve("misc", "harden the login") == "Security Hardening");

    // Default systems follow the configured endpoints.
    bool sawHub = false;
    for (const auto& spec : config.systems) {
        if (spec.kind == AdapterKind::Hub) {
            sawHub = true;
            assert(spec.port == 8102);
        }
    }
    assert(sawHub);
    std::cout << "[PASS] Partial settings override only the named keys." << std::endl;
}

void TestConfiguredSystems(const fs::path& dir) {
    json j = {
        {"projectsRoot", dir.string()},
        {"systems", json::array({
            {{"kind", "service"}, {"id", "api"}, {"name", "API"}, {"port", 5000}, {"directory", "api"},
             {"onlineDetail", "API on :{port}"}},
            {{"kind", "teleporter"}, {"id", "nope"}},
            {{"kind", "presence"}, {"name", "no id"}}
        })}
    };
    HubConfig config = ConfigLoader::FromJson(j);
    assert(config.systems.size() == 1);
    assert(config.systems[0].identity.id == "api");
    assert(config.systems[0].identity.displayName == "API");
    assert(config.systems[0].directory == dir / "api");
    assert(config.systems[0].onlineDetail == "API on :{port}");
    std::cout << "[PASS] Configured systems replace the defaults; bad entries are skipped." << std::endl;
}

void TestMalformedFile(const fs::path& dir) {
    const fs::path file = dir / "broken.json";
    std::ofstream(file) << "{ \"port\": 9100, ";
    HubConfig config = ConfigLoader::Load(file);
    assert(config.port == 8090);

    const fs::path wrongType = dir / "wrong-type.json";
    std::ofstream(wrongType) << "{ \"port\": \"not a number\" }";
    config = ConfigLoader::Load(wrongType);
    assert(config.port == 8090);
    std::cout << "[PASS] Malformed settings fall back to defaults." << std::endl;
}

void TestDeadlineLeavesRoomForProbe() {
    json j = {{"timeouts", {{"probeMs", 2000}, {"deadlineMs", 1000}}}};
    HubConfig config = ConfigLoader::FromJson(j);
    assert(config.probeTimeout == milliseconds(2000));
    assert(config.aggregationDeadline == config.probeTimeout + kMinEnrichment + kDeadlineMargin);

    HubConfig defaults = ConfigLoader::Defaults();
    assert(defaults.aggregationDeadline >= defaults.probeTimeout + kMinEnrichment + kDeadlineMargin);
    std::cout << "[PASS] Aggregation deadline always covers the probe timeout." << std::endl;
}

void TestTokenFromEnvironment() {
    ::setenv("MISSION_CONTROL_GATEWAY_TOKEN", "env-token", 1);
    assert(ConfigLoader::Defaults().gateway.token == "env-token");

    json j = {{"gateway", {{"token", "file-token"}}}};
    assert(ConfigLoader::FromJson(j).gateway.token == "file-token");
    ::unsetenv("MISSION_CONTROL_GATEWAY_TOKEN");
    assert(ConfigLoader::Defaults().gateway.token.empty());
    std::cout << "[PASS] Gateway token is read from the environment." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path dir = fs::temp_directory_path() / "mission_control_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    TestMissingFile(dir);
    TestPartialOverride(dir);
    TestConfiguredSystems(dir);
    TestMalformedFile(dir);
    TestDeadlineLeavesRoomForProbe();
    TestTokenFromEnvironment();

    fs::remove_all(dir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
