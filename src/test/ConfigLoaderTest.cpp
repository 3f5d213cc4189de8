#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"

using namespace equilibra::infrastructure;
using equilibra::domain::HealthCategory;

namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    const std::string testRoot = "test_config_root";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    // No settings.json: defaults.
    {
        auto config = ConfigLoader::Load(testRoot);
        assert(config.dataDir == "data");
        assert(config.historyLimit == 50);
        assert(config.patternWindowDays == 7);
        assert(config.thresholds.minSleepHours == 6.0);
        assert(config.narrative.provider == "template");
        assert(config.preferences.size() == 4);
    }

    // Partial settings keep defaults for the rest.
    {
        std::ofstream out(ConfigLoader::SettingsPath(testRoot));
        out << R"({
            "history_limit": 20,
            "thresholds": {"min_sleep_hours": 7.0},
            "preferences": {"fitness": 0.4},
            "narrative": {"provider": "ollama", "model": "llama3"},
            "window_width": 1600
        })";
    }
    {
        auto config = ConfigLoader::Load(testRoot);
        assert(config.historyLimit == 20);
        assert(config.thresholds.minSleepHours == 7.0);
        assert(config.thresholds.criticalSleepHours == 5.0);
        assert(config.preferences.at(HealthCategory::Fitness) == 0.4);
        assert(config.preferences.at(HealthCategory::Recovery) == 0.25);
        assert(config.narrative.provider == "ollama");
        assert(config.narrative.model == "llama3");
        assert(config.narrative.port == 11434);

        // Saving keeps keys this version does not read.
        config.patternWindowDays = 14;
        assert(ConfigLoader::Save(testRoot, config));
        std::ifstream in(ConfigLoader::SettingsPath(testRoot));
        nlohmann::json j;
        in >> j;
        assert(j["window_width"] == 1600);
        assert(j["pattern_window_days"] == 14);

        auto reloaded = ConfigLoader::Load(testRoot);
        assert(reloaded.patternWindowDays == 14);
        assert(reloaded.narrative.model == "llama3");
    }

    // Malformed settings fall back to defaults.
    {
        std::ofstream out(ConfigLoader::SettingsPath(testRoot));
        out << "{ \"history_limit\": ";
    }
    {
        auto config = ConfigLoader::Load(testRoot);
        assert(config.historyLimit == 50);
        assert(config.narrative.provider == "template");
    }

    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test Passed" << std::endl;
    return 0;
}
