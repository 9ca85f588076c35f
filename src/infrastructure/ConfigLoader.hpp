/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the registry configuration.
 *
 * Sources, highest priority first: process environment, a .env file in the
 * working directory, settings.json in the user config directory.
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace zlinker::infrastructure {

struct RegistryConfig {
    std::string apiUri; ///< SHLINK_API_URI
    std::string apiKey; ///< SHLINK_API_KEY
};

class ConfigLoader {
public:
    static constexpr const char* kApiUriVar = "SHLINK_API_URI";
    static constexpr const char* kApiKeyVar = "SHLINK_API_KEY";

    /**
     * @brief Resolves SHLINK_API_URI and SHLINK_API_KEY.
     * @param workDir Directory searched for a .env file.
     * @return The configuration, or nullopt if either value is missing.
     */
    static std::optional<RegistryConfig> LoadRegistryConfig(const std::filesystem::path& workDir);

    /**
     * @brief Reads KEY=VALUE pairs from a dotenv file.
     *
     * Blank lines and '#' comments are skipped, an "export " prefix is allowed,
     * matching single or double quotes around the value are removed.
     * A missing file yields an empty map.
     */
    static std::map<std::string, std::string> ReadDotEnv(const std::filesystem::path& path);

    /**
     * @brief Reads 'shlink_api_uri' / 'shlink_api_key' from a settings.json file.
     * Missing keys are left empty.
     */
    static RegistryConfig ReadSettingsJson(const std::filesystem::path& path);

    /** @brief $XDG_CONFIG_HOME/zlinker/settings.json, or ~/.config/zlinker/settings.json. */
    static std::filesystem::path GetSettingsPath();
};

} // namespace zlinker::infrastructure
