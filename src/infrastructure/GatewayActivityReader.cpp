#include "infrastructure/GatewayActivityReader.hpp"
#include <ctime>
#include <fstream>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>
#include "infrastructure/TcpProbe.hpp"

namespace missioncontrol::infrastructure {

using json = nlohmann::json;

namespace {

std::optional<json> ReadJsonFile(const std::filesystem::path& file) {
    std::error_code ec;
    if (file.empty() || !std::filesystem::exists(file, ec)) {
        return std::nullopt;
    }
    try {
        std::ifstream f(file);
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        std::cerr << "[GatewayActivityReader] Error reading " << file.string() << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Trimmed lines of a text file that start with `marker`.
std::vector<std::string> MarkedLines(const std::filesystem::path& file, const std::string& marker) {
    std::vector<std::string> lines;
    std::ifstream f(file);
    if (!f.is_open()) return lines;

    std::string line;
    while (std::getline(f, line)) {
        std::string trimmed = Trim(line);
        if (trimmed.compare(0, marker.size(), marker) == 0) {
            lines.push_back(std::move(trimmed));
        }
    }
    return lines;
}

json SessionSummary(const std::string& id, const json& data) {
    json updated = data.is_object() && data.contains("updatedAt") ? data["updatedAt"] : json(nullptr);
    json messages = data.is_object() && data.contains("messageCount") ? data["messageCount"] : json(0);
    return json{{"id", id}, {"updated", updated}, {"messages", messages}};
}

} // namespace

GatewayActivityReader::GatewayActivityReader(GatewaySettings settings)
    : m_settings(std::move(settings)) {}

std::string GatewayActivityReader::LocalDate(std::chrono::system_clock::time_point now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
    return buf;
}

json GatewayActivityReader::readSessions() const {
    json sessions = json::array();
    auto data = ReadJsonFile(m_settings.sessionsFile);
    if (!data) return sessions;

    if (data->is_object()) {
        for (const auto& item : data->items()) {
            if (sessions.size() >= kMaxSessions) break;
            sessions.push_back(SessionSummary(item.key(), item.value()));
        }
    } else if (data->is_array()) {
        for (const auto& s : *data) {
            if (sessions.size() >= kMaxSessions) break;
            std::string id = "?";
            if (s.is_object() && s.contains("id") && s["id"].is_string()) id = s["id"].get<std::string>();
            sessions.push_back(SessionSummary(id, s));
        }
    }
    return sessions;
}

json GatewayActivityReader::readDailyNotes(const std::string& today) const {
    const auto note = m_settings.workspace / "memory" / (today + ".md");
    auto bullets = MarkedLines(note, "- ");

    // Only the most recent entries.
    const size_t skip = bullets.size() > kMaxNotes ? bullets.size() - kMaxNotes : 0;
    return json(std::vector<std::string>(bullets.begin() + static_cast<std::ptrdiff_t>(skip), bullets.end()));
}

json GatewayActivityReader::readOvernightTasks() const {
    auto tasks = MarkedLines(m_settings.workspace / "OVERNIGHT.md", "- [");
    if (tasks.size() > kMaxOvernightTasks) tasks.resize(kMaxOvernightTasks);
    return json(tasks);
}

json GatewayActivityReader::activity(const std::string& today) const {
    json result = {
        {"sessions", readSessions()},
        {"daily_notes", readDailyNotes(today)},
        {"overnight_tasks", readOvernightTasks()},
        {"heartbeat", nullptr}
    };
    if (auto heartbeat = ReadJsonFile(m_settings.workspace / "memory" / "heartbeat-state.json")) {
        result["heartbeat"] = *heartbeat;
    }
    return result;
}

json GatewayActivityReader::health(std::chrono::milliseconds probeTimeout) const {
    const auto& endpoint = m_settings.endpoint;
    json result = {
        {"status", "offline"},
        {"port", endpoint.port},
        {"version", nullptr},
        {"model", nullptr},
        {"plugins", json::array()},
        {"telegram", nullptr},
        {"workspace", m_settings.workspace.string()}
    };

    if (!TcpProbe::isReachable(endpoint.host, endpoint.port, probeTimeout)) {
        return result;
    }
    result["status"] = "online";

    auto cfg = ReadJsonFile(m_settings.configFile);
    if (!cfg || !cfg->is_object()) return result;

    try {
        result["version"] = cfg->value(json::json_pointer("/meta/lastTouchedVersion"), json(nullptr));
        result["model"] = cfg->value(json::json_pointer("/agents/defaults/model/primary"), json("unknown"));

        auto entries = cfg->value(json::json_pointer("/plugins/entries"), json::object());
        for (const auto& item : entries.items()) {
            if (item.value().is_object() && item.value().value("enabled", false)) {
                result["plugins"].push_back(item.key());
            }
        }

        bool telegram = cfg->value(json::json_pointer("/channels/telegram/enabled"), false);
        result["telegram"] = telegram ? "enabled" : "disabled";
    } catch (const json::exception& e) {
        std::cerr << "[GatewayActivityReader] Unexpected config shape: " << e.what() << std::endl;
    }
    return result;
}

} // namespace missioncontrol::infrastructure
