/**
 * @file HubConfig.hpp
 * @brief Immutable process configuration, built once at startup.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "domain/LabelTable.hpp"
#include "domain/ProxyTarget.hpp"
#include "domain/SystemAdapter.hpp"

namespace missioncontrol::infrastructure {

/**
 * @enum AdapterKind
 * @brief Which adapter implementation a configured system uses.
 */
enum class AdapterKind {
    Gateway,
    Hub,
    Inference,
    Presence,
    Service,
    Worker,
    Self
};

/**
 * @struct AdapterSpec
 * @brief Configuration of one observed system. Fields a kind does not use are ignored.
 */
struct AdapterSpec {
    AdapterKind kind = AdapterKind::Service;
    domain::SystemIdentity identity;
    std::string host = "127.0.0.1";
    int port = 0;                          ///< 0 for Self means "the listen port".
    std::string url;                       ///< Link shown when online; derived from port if empty.
    std::filesystem::path directory;       ///< Install directory (presence/service/worker).
    std::filesystem::path configFile;      ///< Gateway JSON config.
    std::filesystem::path journalFile;     ///< Presence: count non-blank lines.
    std::filesystem::path countDirectory;  ///< Presence: count files ...
    std::string countExtension;            ///< ... with this extension.
    std::string detailTemplate;            ///< Presence: "{count}" is substituted.
    std::string onlineDetail;              ///< Service: detail when reachable; "{port}" is substituted.
    std::string description;               ///< Static detail used when nothing better is known.
};

struct Endpoint {
    std::string host = "127.0.0.1";
    int port = 0;
};

struct GatewaySettings {
    Endpoint endpoint{"127.0.0.1", 18800};
    std::filesystem::path configFile;
    std::filesystem::path workspace;
    std::filesystem::path sessionsFile;
    std::string token;
    std::string chatModel = "qwen2.5:14b-instruct";
};

/// Slack kept between a worst-case adapter pass and the aggregation deadline.
constexpr std::chrono::milliseconds kDeadlineMargin{250};
/// Shortest health enrichment call worth attempting.
constexpr std::chrono::milliseconds kMinEnrichment{250};

struct HubConfig {
    std::string listenHost = "127.0.0.1";
    int port = 8090;

    std::filesystem::path projectsRoot;
    std::filesystem::path projectsFile;
    std::filesystem::path sessionLog;
    std::string selfDirectoryName = "project-hub";  ///< Skipped by the directory scan.

    GatewaySettings gateway;
    Endpoint hub{"127.0.0.1", 8002};
    Endpoint worker{"127.0.0.1", 8095};

    std::chrono::milliseconds probeTimeout{1000};
    std::chrono::milliseconds aggregationDeadline{2500};
    domain::TimeoutBudgets budgets;
    std::chrono::hours recencyWindow{48};

    std::vector<AdapterSpec> systems;
    domain::LabelTable labels = domain::LabelTable::Defaults();
};

} // namespace missioncontrol::infrastructure
