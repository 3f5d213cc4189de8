/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place instead of scattering it
 * through the services.
 */

#pragma once

#include <string>
#include "domain/Category.hpp"
#include "domain/UserProfile.hpp"

namespace equilibra::infrastructure {

/**
 * @struct NarrativeConfig
 * @brief Selects and tunes the narrative strategy.
 */
struct NarrativeConfig {
    std::string provider = "template";   ///< "template" or "ollama".
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    int timeoutSeconds = 20;
};

struct AppConfig {
    std::string dataDir = "data";
    std::string logDir = "logs/decisions";
    size_t historyLimit = 50;
    int patternWindowDays = 7;
    domain::ConstraintThresholds thresholds;
    domain::CategoryWeights preferences = domain::UniformCategoryWeights();
    NarrativeConfig narrative;
    std::string videoDriver;   ///< Optional SDL video driver hint ("x11", "wayland").
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the project root.
     *
     * A missing file or missing keys yield defaults. A malformed file is
     * reported on std::cerr and defaults are returned.
     */
    static AppConfig Load(const std::string& projectRoot);

    /**
     * @brief Writes the config back to settings.json, pretty-printed.
     * Unknown keys already in the file are preserved.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& projectRoot, const AppConfig& config);

    static std::string SettingsPath(const std::string& projectRoot);
};

} // namespace equilibra::infrastructure
