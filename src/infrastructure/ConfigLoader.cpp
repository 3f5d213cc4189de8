/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace equilibra::infrastructure {

std::string ConfigLoader::SettingsPath(const std::string& projectRoot) {
    return (std::filesystem::path(projectRoot) / "settings.json").string();
}

AppConfig ConfigLoader::Load(const std::string& projectRoot) {
    AppConfig config;
    const std::filesystem::path configPath = SettingsPath(projectRoot);
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.dataDir = j.value("data_dir", config.dataDir);
        config.logDir = j.value("log_dir", config.logDir);
        config.historyLimit = std::max<size_t>(1, j.value("history_limit", config.historyLimit));
        config.patternWindowDays = std::max(1, j.value("pattern_window_days", config.patternWindowDays));
        config.videoDriver = j.value("video_driver", config.videoDriver);

        if (j.contains("thresholds")) {
            config.thresholds = j["thresholds"].get<domain::ConstraintThresholds>();
        }
        if (j.contains("preferences")) {
            for (const auto& [category, value] : WeightsFromJson(j["preferences"])) {
                config.preferences[category] = value;
            }
        }
        if (j.contains("narrative")) {
            const auto& n = j["narrative"];
            config.narrative.provider = n.value("provider", config.narrative.provider);
            config.narrative.host = n.value("host", config.narrative.host);
            config.narrative.port = n.value("port", config.narrative.port);
            config.narrative.model = n.value("model", config.narrative.model);
            config.narrative.timeoutSeconds = n.value("timeout_seconds", config.narrative.timeoutSeconds);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return AppConfig{};
    }

    return config;
}

bool ConfigLoader::Save(const std::string& projectRoot, const AppConfig& config) {
    const std::filesystem::path configPath = SettingsPath(projectRoot);
    nlohmann::json j = nlohmann::json::object();

    // Keep keys this version does not know about.
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json unreadable, overwriting: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["data_dir"] = config.dataDir;
    j["log_dir"] = config.logDir;
    j["history_limit"] = config.historyLimit;
    j["pattern_window_days"] = config.patternWindowDays;
    j["thresholds"] = config.thresholds;
    j["preferences"] = WeightsToJson(config.preferences);
    j["narrative"] = {
        {"provider", config.narrative.provider},
        {"host", config.narrative.host},
        {"port", config.narrative.port},
        {"model", config.narrative.model},
        {"timeout_seconds", config.narrative.timeoutSeconds}
    };
    if (!config.videoDriver.empty()) {
        j["video_driver"] = config.videoDriver;
    }

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath << std::endl;
        return false;
    }
    f << j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
    if (f.fail()) {
        std::cerr << "[ConfigLoader] Error writing settings.json" << std::endl;
        return false;
    }
    return true;
}

} // namespace equilibra::infrastructure
