/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (settings.json).
 *
 * Provides a unified way to build the immutable HubConfig without scattering
 * JSON parsing logic throughout the codebase. Every key is optional; missing
 * keys keep their built-in defaults.
 */

#pragma once

#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param settingsFile Path to the file. A missing file is not an error.
     * @return The parsed configuration, or the defaults when the file is absent or malformed.
     */
    static HubConfig Load(const std::filesystem::path& settingsFile);

    /** @brief Configuration with every key at its default. */
    static HubConfig Defaults();

    /**
     * @brief Builds a configuration from an already parsed document.
     * @throws nlohmann::json::exception when a key has the wrong type.
     */
    static HubConfig FromJson(const nlohmann::json& j);

    /** @brief The systems observed when the configuration lists none. */
    static std::vector<AdapterSpec> DefaultSystems(const HubConfig& config);
};

} // namespace missioncontrol::infrastructure
