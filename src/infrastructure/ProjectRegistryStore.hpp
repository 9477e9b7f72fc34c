/**
 * @file ProjectRegistryStore.hpp
 * @brief Read-only access to the on-disk project registry (PROJECTS.json).
 */

#pragma once
#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ProjectRecord.hpp"

namespace missioncontrol::infrastructure {

/**
 * @class ProjectRegistryStore
 * @brief Reads the registry document. Mutation belongs to the registry's owner.
 */
class ProjectRegistryStore {
public:
    explicit ProjectRegistryStore(std::filesystem::path registryFile);

    /**
     * @brief The raw document.
     * @return `{"projects": [], "metadata": {}}` when the file is missing or unreadable.
     */
    nlohmann::json loadDocument() const;

    /** @brief The `projects` array as records. Entries that are not objects are skipped. */
    std::vector<domain::ProjectRecord> loadProjects() const;

    /** @brief Converts one registry entry; tolerant of null or mistyped fields. */
    static domain::ProjectRecord FromJson(const nlohmann::json& node);

private:
    std::filesystem::path m_registryFile;
};

} // namespace missioncontrol::infrastructure
