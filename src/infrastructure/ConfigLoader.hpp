/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing of the settings file in one place instead of scattering
 * it through the resolver and the CLI.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "infrastructure/AppConfig.hpp"

namespace draftlens::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a file.
     * @param settingsPath Path to settings.json.
     * @return Parsed configuration, or defaults when the file is missing or unreadable.
     */
    static AppConfig Load(const std::string& settingsPath);

    /**
     * @brief Builds a configuration from an already parsed document.
     * @param errors Receives one message per rejected value; the default is kept for it.
     */
    static AppConfig Parse(const nlohmann::json& j, std::vector<std::string>& errors);

    /** @brief Checks a loaded configuration. Empty result means valid. */
    static std::vector<std::string> Validate(const AppConfig& config);

    /** @brief $XDG_CONFIG_HOME/draftlens/settings.json */
    static std::string DefaultSettingsPath();

    /** @brief Serializes @p config back to the settings.json layout. */
    static nlohmann::json ToJson(const AppConfig& config);
};

} // namespace draftlens::infrastructure
