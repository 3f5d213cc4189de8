/**
 * @file CompositionRoot.cpp
 * @brief Implementation of BuildServices.
 */
#include "app/CompositionRoot.hpp"

#include <filesystem>
#include <iostream>
#include "application/TemplateNarrativeService.hpp"
#include "infrastructure/DecisionLogStore.hpp"
#include "infrastructure/JsonHistoryRepository.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaNarrativeAdapter.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace equilibra::app {

application::AppServices BuildServices(const std::string& projectRoot, const infrastructure::AppConfig& config) {
    auto root = std::filesystem::path(projectRoot);
    application::AppServices services;

    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    services.repository = std::make_shared<infrastructure::JsonHistoryRepository>(
        (root / config.dataDir).string(), services.persistenceService, config.historyLimit);
    services.logStore = std::make_shared<infrastructure::DecisionLogStore>(
        (root / config.logDir).string(), services.persistenceService);

    // settings.json owns the tuning; the stored profile keeps identity and goal.
    auto profile = services.repository->getProfile();
    profile.thresholds = config.thresholds;
    profile.preferences = config.preferences;
    services.repository->saveProfile(profile);

    auto templateNarrative = std::make_shared<application::TemplateNarrativeService>();
    if (config.narrative.provider == "ollama") {
        auto client = std::make_unique<infrastructure::OllamaClient>(
            config.narrative.host, config.narrative.port, 3, config.narrative.timeoutSeconds);
        services.narrativeService = std::make_shared<infrastructure::OllamaNarrativeAdapter>(
            templateNarrative, std::move(client), config.narrative.model);
    } else {
        if (config.narrative.provider != "template") {
            std::cerr << "[CompositionRoot] Unknown narrative provider '" << config.narrative.provider
                      << "', using template" << std::endl;
        }
        services.narrativeService = templateNarrative;
    }
    std::cout << "[CompositionRoot] Narrative strategy: " << services.narrativeService->name() << std::endl;

    services.decisionService = std::make_unique<application::DecisionCycleService>(
        services.repository, services.narrativeService, services.logStore, config.patternWindowDays);
    services.simulationService = std::make_unique<application::WeekSimulationService>(
        templateNarrative, config.thresholds, config.preferences);
    services.taskManager = std::make_shared<application::AsyncTaskManager>();
    return services;
}

} // namespace equilibra::app
