#include "infrastructure/ProjectRegistryStore.hpp"
#include <fstream>
#include <iostream>

namespace missioncontrol::infrastructure {

using json = nlohmann::json;

namespace {

json EmptyDocument() {
    return json{{"projects", json::array()}, {"metadata", json::object()}};
}

std::string StringField(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

ProjectRegistryStore::ProjectRegistryStore(std::filesystem::path registryFile)
    : m_registryFile(std::move(registryFile)) {}

json ProjectRegistryStore::loadDocument() const {
    std::error_code ec;
    if (!std::filesystem::exists(m_registryFile, ec)) {
        return EmptyDocument();
    }

    try {
        std::ifstream f(m_registryFile);
        json j;
        f >> j;
        if (j.is_object()) return j;
        std::cerr << "[ProjectRegistryStore] " << m_registryFile.string() << " is not a JSON object." << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[ProjectRegistryStore] Error reading " << m_registryFile.string() << ": " << e.what() << std::endl;
    }
    return EmptyDocument();
}

std::vector<domain::ProjectRecord> ProjectRegistryStore::loadProjects() const {
    std::vector<domain::ProjectRecord> projects;
    json doc = loadDocument();
    auto it = doc.find("projects");
    if (it == doc.end() || !it->is_array()) return projects;

    for (const auto& node : *it) {
        if (!node.is_object()) continue;
        projects.push_back(FromJson(node));
    }
    return projects;
}

domain::ProjectRecord ProjectRegistryStore::FromJson(const json& node) {
    domain::ProjectRecord record;
    record.name = StringField(node, "name");
    record.path = StringField(node, "path");
    record.status = StringField(node, "status");
    record.description = StringField(node, "description");
    record.lastActive = StringField(node, "last_active");
    auto pinned = node.find("pinned");
    record.pinned = pinned != node.end() && pinned->is_boolean() && pinned->get<bool>();
    return record;
}

} // namespace missioncontrol::infrastructure
