#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "app/EquilibraApp.hpp"
#include "application/TemplateNarrativeService.hpp"
#include "application/WeekSimulationService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonCodec.hpp"

using namespace equilibra;

namespace {

// Headless run of a scenario, written as one JSON document.
int RunSimulation(const std::string& root, const std::string& scenario, const std::string& outPath) {
    const auto config = infrastructure::ConfigLoader::Load(root);
    application::WeekSimulationService simulator(std::make_shared<application::TemplateNarrativeService>(),
                                                 config.thresholds, config.preferences);
    auto run = simulator.Run(scenario);

    infrastructure::json out = {
        {"scenario", run.scenario.key},
        {"forecast", run.forecast},
        {"weekly_report", run.report},
        {"days", infrastructure::json::array()}
    };
    for (const auto& day : run.days) {
        out["days"].push_back({
            {"day", day.day},
            {"readiness", day.readiness},
            {"decision", day.decision},
            {"adaptations", day.adaptations}
        });
    }
    std::ofstream file(outPath);
    if (!file) {
        std::cerr << "[main] Cannot write " << outPath << std::endl;
        return 1;
    }
    file << infrastructure::DumpJson(out, 2) << std::endl;
    std::cout << "[main] Simulation written to " << outPath << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const std::string root = std::filesystem::current_path().string();

    if (argc >= 2 && std::strcmp(argv[1], "--simulate") == 0) {
        const std::string scenario = argc >= 3 ? argv[2] : "burnout_recovery";
        const std::string outPath = argc >= 4 ? argv[3] : "simulation_" + scenario + ".json";
        return RunSimulation(root, scenario, outPath);
    }
    if (argc >= 2) {
        std::cerr << "Usage: " << argv[0] << " [--simulate <scenario> [output.json]]" << std::endl;
        return 2;
    }

    app::EquilibraApp app(root);
    return app.Run();
}
