/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/DecisionCycleService.hpp"
#include "application/WeekSimulationService.hpp"
#include "application/AsyncTaskManager.hpp"
#include "domain/HistoryRepository.hpp"
#include "domain/NarrativeService.hpp"
#include "infrastructure/DecisionLogStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace equilibra::application {

struct AppServices {
    std::shared_ptr<domain::HistoryRepository> repository;
    std::shared_ptr<domain::NarrativeService> narrativeService;
    std::shared_ptr<infrastructure::DecisionLogStore> logStore;
    std::unique_ptr<DecisionCycleService> decisionService;
    std::unique_ptr<WeekSimulationService> simulationService;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace equilibra::application
