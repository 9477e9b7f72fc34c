/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

namespace missioncontrol::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds ReadMillis(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    long long value = j.at(key).get<long long>();
    return value > 0 ? std::chrono::milliseconds(value) : fallback;
}

Endpoint ReadEndpoint(const json& j, const char* key, Endpoint fallback) {
    if (!j.contains(key) || !j.at(key).is_object()) return fallback;
    const json& node = j.at(key);
    Endpoint endpoint = fallback;
    endpoint.host = node.value("host", fallback.host);
    endpoint.port = node.value("port", fallback.port);
    return endpoint;
}

std::optional<AdapterKind> KindFromString(const std::string& value) {
    if (value == "gateway") return AdapterKind::Gateway;
    if (value == "hub") return AdapterKind::Hub;
    if (value == "inference") return AdapterKind::Inference;
    if (value == "presence") return AdapterKind::Presence;
    if (value == "service") return AdapterKind::Service;
    if (value == "worker") return AdapterKind::Worker;
    if (value == "self") return AdapterKind::Self;
    return std::nullopt;
}

std::optional<AdapterSpec> ReadAdapterSpec(const json& node, const fs::path& root) {
    auto kind = KindFromString(node.value("kind", std::string()));
    if (!kind) {
        std::cerr << "[ConfigLoader] Skipping system with unknown kind: " << node.dump() << std::endl;
        return std::nullopt;
    }

    AdapterSpec spec;
    spec.kind = *kind;
    spec.identity.id = node.value("id", std::string());
    spec.identity.displayName = node.value("name", spec.identity.id);
    spec.identity.icon = node.value("icon", std::string());
    if (node.contains("tags")) {
        for (const auto& tag : node.at("tags")) {
            spec.identity.tags.insert(tag.get<std::string>());
        }
    }
    if (spec.identity.id.empty()) {
        std::cerr << "[ConfigLoader] Skipping system without id." << std::endl;
        return std::nullopt;
    }

    spec.host = node.value("host", spec.host);
    spec.port = node.value("port", 0);
    spec.url = node.value("url", std::string());
    spec.directory = PathUtils::Resolve(node.value("directory", std::string()), root);
    spec.configFile = PathUtils::Resolve(node.value("configFile", std::string()), root);
    spec.journalFile = PathUtils::Resolve(node.value("journalFile", std::string()), root);
    spec.countDirectory = PathUtils::Resolve(node.value("countDirectory", std::string()), root);
    spec.countExtension = node.value("countExtension", std::string());
    spec.detailTemplate = node.value("detailTemplate", std::string());
    spec.onlineDetail = node.value("onlineDetail", std::string());
    spec.description = node.value("description", std::string());
    return spec;
}

} // namespace

HubConfig ConfigLoader::Load(const fs::path& settingsFile) {
    if (!fs::exists(settingsFile)) {
        std::cout << "[ConfigLoader] No settings at " << settingsFile.string() << ", using defaults." << std::endl;
        return Defaults();
    }

    try {
        std::ifstream f(settingsFile);
        json j;
        f >> j;
        HubConfig config = FromJson(j);
        std::cout << "[ConfigLoader] Loaded " << settingsFile.string() << std::endl;
        return config;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsFile.string() << ": " << e.what()
                  << ". Using defaults." << std::endl;
    }
    return Defaults();
}

HubConfig ConfigLoader::Defaults() {
    return FromJson(json::object());
}

HubConfig ConfigLoader::FromJson(const json& j) {
    HubConfig config;

    config.listenHost = j.value("listenHost", config.listenHost);
    config.port = j.value("port", config.port);

    config.projectsRoot = PathUtils::ExpandUser(j.value("projectsRoot", std::string("~/ProjectsHome")));
    config.projectsFile = PathUtils::Resolve(j.value("projectsFile", std::string("PROJECTS.json")), config.projectsRoot);
    config.sessionLog = PathUtils::Resolve(j.value("sessionLog", std::string(".claude-data/history.jsonl")),
                                           config.projectsRoot);
    config.selfDirectoryName = j.value("selfDirectoryName", config.selfDirectoryName);

    const json gateway = j.contains("gateway") ? j.at("gateway") : json::object();
    config.gateway.endpoint.host = gateway.value("host", config.gateway.endpoint.host);
    config.gateway.endpoint.port = gateway.value("port", config.gateway.endpoint.port);
    config.gateway.configFile = PathUtils::ExpandUser(gateway.value("configFile", std::string("~/.openclaw/openclaw.json")));
    config.gateway.workspace = PathUtils::ExpandUser(gateway.value("workspace", std::string("~/.openclaw/workspace")));
    config.gateway.sessionsFile = PathUtils::ExpandUser(
        gateway.value("sessionsFile", std::string("~/.openclaw/agents/main/sessions/sessions.json")));
    config.gateway.token = gateway.value("token", std::string());
    config.gateway.chatModel = gateway.value("model", config.gateway.chatModel);
    if (config.gateway.token.empty()) {
        const char* token = std::getenv("MISSION_CONTROL_GATEWAY_TOKEN");
        if (token && *token) config.gateway.token = token;
    }

    config.hub = ReadEndpoint(j, "hub", config.hub);
    config.worker = ReadEndpoint(j, "worker", config.worker);

    if (j.contains("timeouts")) {
        const json& t = j.at("timeouts");
        config.probeTimeout = ReadMillis(t, "probeMs", config.probeTimeout);
        config.aggregationDeadline = ReadMillis(t, "deadlineMs", config.aggregationDeadline);
        config.budgets.health = ReadMillis(t, "healthMs", config.budgets.health);
        config.budgets.standard = ReadMillis(t, "standardMs", config.budgets.standard);
        config.budgets.action = ReadMillis(t, "actionMs", config.budgets.action);
        config.budgets.dispatch = ReadMillis(t, "dispatchMs", config.budgets.dispatch);
    }
    const auto shortestDeadline = config.probeTimeout + kMinEnrichment + kDeadlineMargin;
    if (config.aggregationDeadline < shortestDeadline) {
        std::cerr << "[ConfigLoader] deadlineMs " << config.aggregationDeadline.count()
                  << " leaves no room after probeMs " << config.probeTimeout.count() << "; using "
                  << shortestDeadline.count() << "." << std::endl;
        config.aggregationDeadline = shortestDeadline;
    }

    int recencyHours = j.value("recencyHours", static_cast<int>(config.recencyWindow.count()));
    if (recencyHours > 0) config.recencyWindow = std::chrono::hours(recencyHours);

    if (j.contains("labels") || j.contains("messageLabels")) {
        std::vector<domain::LabelRule> rules;
        std::vector<domain::MessageLabelRule> messageRules;
        if (j.contains("labels")) {
            for (const auto& item : j.at("labels")) {
                rules.push_back({item.at("match").get<std::string>(), item.at("label").get<std::string>()});
            }
        } else {
            rules = domain::LabelTable::Defaults().rules();
        }
        if (j.contains("messageLabels")) {
            for (const auto& item : j.at("messageLabels")) {
                messageRules.push_back({item.at("keywords").get<std::vector<std::string>>(),
                                        item.at("label").get<std::string>()});
            }
        } else {
            messageRules = domain::LabelTable::Defaults().messageRules();
        }
        config.labels = domain::LabelTable(std::move(rules), std::move(messageRules));
    }

    if (j.contains("systems") && j.at("systems").is_array()) {
        for (const auto& node : j.at("systems")) {
            if (auto spec = ReadAdapterSpec(node, config.projectsRoot)) {
                config.systems.push_back(std::move(*spec));
            }
        }
    } else {
        config.systems = DefaultSystems(config);
    }

    return config;
}

std::vector<AdapterSpec> ConfigLoader::DefaultSystems(const HubConfig& config) {
    const fs::path& root = config.projectsRoot;
    std::vector<AdapterSpec> systems;

    AdapterSpec gateway;
    gateway.kind = AdapterKind::Gateway;
    gateway.identity = {"openclaw", "OpenClaw Agent", "\U0001F99E", {"ai-agent", "local", "telegram"}};
    gateway.host = config.gateway.endpoint.host;
    gateway.port = config.gateway.endpoint.port;
    gateway.configFile = config.gateway.configFile;
    systems.push_back(gateway);

    AdapterSpec hub;
    hub.kind = AdapterKind::Hub;
    hub.identity = {"moltbot", "MoltBot Hub", "\U0001F916", {"ai-agent", "docker", "wsl"}};
    hub.host = config.hub.host;
    hub.port = config.hub.port;
    systems.push_back(hub);

    AdapterSpec inference;
    inference.kind = AdapterKind::Inference;
    inference.identity = {"ollama", "Ollama", "\U0001F9E0", {"inference", "local", "gpu"}};
    inference.port = 11434;
    inference.description = "Local LLM inference";
    systems.push_back(inference);

    AdapterSpec desk;
    desk.kind = AdapterKind::Presence;
    desk.identity = {"profit-desk", "Profit Desk", "\U0001F4CA", {"trading", "multi-agent", "python"}};
    desk.directory = root / "profit-desk";
    desk.journalFile = root / "profit-desk" / "journal" / "journal.jsonl";
    desk.detailTemplate = "6 agents | {count} journal entries | PAPER mode";
    desk.description = "Multi-agent trading desk (6 agents)";
    systems.push_back(desk);

    AdapterSpec scratchpad;
    scratchpad.kind = AdapterKind::Presence;
    scratchpad.identity = {"scls", "SCLS (Scratchpad)", "\U0001F4DD", {"learning", "memory", "framework"}};
    scratchpad.directory = root / "exo";
    scratchpad.countDirectory = root / "exo" / "memory";
    scratchpad.countExtension = ".md";
    scratchpad.detailTemplate = "{count} memory files | File-based learning across sessions";
    scratchpad.description = "Scratchpad Continual Learning System";
    systems.push_back(scratchpad);

    AdapterSpec tradeBot;
    tradeBot.kind = AdapterKind::Service;
    tradeBot.identity = {"master-trade-bot", "Master Trade Bot", "\U0001F4B9", {"trading", "typescript", "websocket"}};
    tradeBot.port = 4000;
    tradeBot.url = "http://localhost:4000";
    tradeBot.directory = root / "master-trade-bot";
    tradeBot.onlineDetail = "Dashboard live on :{port}";
    tradeBot.description = "5 engines (Solana, Polymarket, Binance, Coinbase, ETH DeFi)";
    systems.push_back(tradeBot);

    AdapterSpec worker;
    worker.kind = AdapterKind::Worker;
    worker.identity = {"auton", "Auton", "⚙️", {"background-worker", "autonomous", "python"}};
    worker.host = config.worker.host;
    worker.port = config.worker.port;
    worker.url = "http://localhost:" + std::to_string(config.worker.port);
    worker.directory = root / "auton";
    systems.push_back(worker);

    AdapterSpec self;
    self.kind = AdapterKind::Self;
    self.identity = {"project-hub", "Mission Control", "\U0001F39B️", {"dashboard", "cpp", "always-on"}};
    self.description = "This dashboard - nerve center for all systems";
    systems.push_back(self);

    return systems;
}

} // namespace missioncontrol::infrastructure
