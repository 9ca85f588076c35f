/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace zlinker::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

} // namespace

std::optional<RegistryConfig> ConfigLoader::LoadRegistryConfig(const fs::path& workDir) {
    RegistryConfig config;
    config.apiUri = GetEnv(kApiUriVar);
    config.apiKey = GetEnv(kApiKeyVar);

    if (config.apiUri.empty() || config.apiKey.empty()) {
        auto dotenv = ReadDotEnv(workDir / ".env");
        if (config.apiUri.empty()) config.apiUri = dotenv[kApiUriVar];
        if (config.apiKey.empty()) config.apiKey = dotenv[kApiKeyVar];
    }

    if (config.apiUri.empty() || config.apiKey.empty()) {
        RegistryConfig settings = ReadSettingsJson(GetSettingsPath());
        if (config.apiUri.empty()) config.apiUri = settings.apiUri;
        if (config.apiKey.empty()) config.apiKey = settings.apiKey;
    }

    if (config.apiUri.empty() || config.apiKey.empty()) {
        return std::nullopt;
    }
    return config;
}

std::map<std::string, std::string> ConfigLoader::ReadDotEnv(const fs::path& path) {
    std::map<std::string, std::string> values;
    if (!fs::exists(path)) {
        return values;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << path << std::endl;
        return values;
    }

    std::string line;
    while (std::getline(f, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = Trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = Trim(line.substr(0, eq));
        std::string value = Trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) values[key] = value;
    }
    return values;
}

RegistryConfig ConfigLoader::ReadSettingsJson(const fs::path& path) {
    RegistryConfig config;
    if (!fs::exists(path)) {
        return config;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;

        if (j.contains("shlink_api_uri") && j["shlink_api_uri"].is_string()) {
            config.apiUri = j["shlink_api_uri"].get<std::string>();
        }
        if (j.contains("shlink_api_key") && j["shlink_api_key"].is_string()) {
            config.apiKey = j["shlink_api_key"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return config;
}

fs::path ConfigLoader::GetSettingsPath() {
    std::string xdgConfigHome = GetEnv("XDG_CONFIG_HOME");
    if (!xdgConfigHome.empty()) {
        return fs::path(xdgConfigHome) / "zlinker" / "settings.json";
    }
    std::string home = GetEnv("HOME");
    if (!home.empty()) {
        return fs::path(home) / ".config" / "zlinker" / "settings.json";
    }
    return fs::current_path() / "settings.json";
}

} // namespace zlinker::infrastructure
