/**
 * @file DashboardState.cpp
 * @brief Implementation of the dashboard actions and log.
 */
#include "ui/DashboardState.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace equilibra::ui {

using namespace equilibra::domain;

domain::StateSnapshot StateInputs::ToSnapshot() const {
    StateSnapshot s;
    s.timestamp = std::chrono::system_clock::now();
    s.sleepHours = sleepHours;
    s.energyLevel = energyLevel;
    s.stressLevel = stressIndex <= 0 ? StressLevel::Low : stressIndex == 1 ? StressLevel::Medium : StressLevel::High;
    s.timeAvailableHours = timeAvailableHours;
    s.sleepDebtHours = sleepDebtHours;
    s.consecutiveHighEffortDays = consecutiveHighEffortDays;
    return s.clamped();
}

DashboardState::DashboardState() {
    outputLog = "Equilibra - decision engine ready.\n";
}

DashboardState::~DashboardState() {
    if (services.taskManager) {
        services.taskManager->WaitForIdle();
    }
}

void DashboardState::InjectServices(application::AppServices&& newServices) {
    services = std::move(newServices);
    const std::string narrative = services.decisionService ? services.decisionService->NarrativeName() : "none";
    AppendLog("[System] Services injected (narrative: " + narrative + ").\n");
}

void DashboardState::RunDecision() {
    if (!services.decisionService || !services.taskManager) return;
    if (services.taskManager->IsBusy(application::TaskType::DecisionCycle)) {
        AppendLog("[System] Busy: a decision cycle is already running.\n");
        return;
    }

    const StateSnapshot snapshot = inputs.ToSnapshot();
    const std::vector<PlannedTask> tasks = plannedTasks;
    AppendLog("[Decision] Cycle started.\n");

    services.taskManager->SubmitTask(application::TaskType::DecisionCycle, "Decision cycle",
        [this, snapshot, tasks](std::shared_ptr<application::TaskStatus> status) {
            auto cycle = services.decisionService->RunCycle(snapshot, tasks, true);
            status->progress = 0.6f;
            auto adjustment = services.decisionService->AdjustPlan(cycle.decision, tasks);

            std::ostringstream line;
            line << "[Decision] " << cycle.decision.id << ": " << cycle.decision.reasoningSummary
                 << " (confidence " << static_cast<int>(cycle.decision.confidenceScore * 100.0 + 0.5) << "%)\n";
            for (const auto& record : adjustment.adaptations) {
                line << "[Adaptation] " << record.patternDetected << ": " << record.adaptationMade << "\n";
            }

            {
                std::lock_guard<std::mutex> lock(resultsMutex);
                results.lastCycle = std::move(cycle);
                results.lastAdjustment = std::move(adjustment);
            }
            AppendLog(line.str());
        });
}

void DashboardState::ConsultCouncil() {
    if (!services.decisionService) return;

    // Four heuristic agents finish in microseconds; no need for a background job.
    const auto mode = council.parallel ? domain::services::EvaluationMode::Parallel
                                       : domain::services::EvaluationMode::Sequential;
    auto consensus = services.decisionService->ConsultCouncil(inputs.ToSnapshot(), council.activity, council.goal, mode);
    AppendLog("[Council] " + std::string(council.activity) + " -> " + CouncilActionToString(consensus.finalAction) + "\n");

    std::lock_guard<std::mutex> lock(resultsMutex);
    results.consensus = std::move(consensus);
}

void DashboardState::RefreshInsights() {
    if (!services.decisionService || !services.taskManager) return;
    if (services.taskManager->IsBusy(application::TaskType::Narrative)) return;

    services.taskManager->SubmitTask(application::TaskType::Narrative, "Forecast and weekly insight",
        [this](std::shared_ptr<application::TaskStatus> status) {
            auto forecast = services.decisionService->ForecastBurnout();
            auto report = services.decisionService->WeeklyReport();
            auto stats = services.decisionService->Statistics();
            status->progress = 0.5f;
            std::string insight = services.decisionService->WeeklyInsight();

            {
                std::lock_guard<std::mutex> lock(resultsMutex);
                results.forecast = forecast;
                results.weeklyReport = std::move(report);
                results.statistics = std::move(stats);
                results.weeklyInsight = std::move(insight);
            }
            AppendLog("[Forecast] Burnout risk " + std::to_string(forecast.riskScore) + " (" +
                      SeverityToString(forecast.severity) + ")\n");
        });
}

void DashboardState::RunSimulation() {
    if (!services.simulationService || !services.taskManager) return;
    if (services.taskManager->IsBusy(application::TaskType::Simulation)) {
        AppendLog("[System] Busy: a simulation is already running.\n");
        return;
    }

    const auto& scenarios = application::WeekSimulationService::Scenarios();
    const int index = std::clamp(simulation.scenarioIndex, 0, static_cast<int>(scenarios.size()) - 1);
    const std::string key = scenarios[static_cast<size_t>(index)].key;
    const int days = std::max(1, simulation.days);
    const double hours = simulation.timeAvailableHours;

    {
        std::lock_guard<std::mutex> lock(resultsMutex);
        results.simulationDays.clear();
        results.simulation.reset();
    }
    AppendLog("[Simulation] Running " + key + "...\n");

    services.taskManager->SubmitTask(application::TaskType::Simulation, "Week simulation: " + key,
        [this, key, days, hours](std::shared_ptr<application::TaskStatus> status) {
            auto run = services.simulationService->Run(key, days, hours, std::chrono::system_clock::now(),
                [this, status, days](const application::SimulatedDay& day) {
                    status->progress = static_cast<float>(day.day) / static_cast<float>(days);
                    std::lock_guard<std::mutex> lock(resultsMutex);
                    results.simulationDays.push_back(day);
                });

            AppendLog("[Simulation] " + key + " finished: burnout risk " + std::to_string(run.forecast.riskScore) + "\n");
            std::lock_guard<std::mutex> lock(resultsMutex);
            results.simulation = std::move(run);
        });
}

void DashboardState::ExportSession() {
    if (!services.logStore) return;
    const std::string path = services.logStore->exportSession();
    AppendLog("[Export] Session written to " + path + "\n");
    std::lock_guard<std::mutex> lock(resultsMutex);
    results.lastExportPath = path;
}

void DashboardState::ClearHistory() {
    if (!services.repository) return;
    services.repository->clearHistory();
    AppendLog("[System] Decision history cleared.\n");
    std::lock_guard<std::mutex> lock(resultsMutex);
    results.forecast.reset();
    results.weeklyReport.reset();
    results.statistics.reset();
    results.weeklyInsight.clear();
}

bool DashboardState::IsBusy(application::TaskType type) {
    return services.taskManager && services.taskManager->IsBusy(type);
}

void DashboardState::AppendLog(const std::string& line) {
    std::lock_guard<std::mutex> lock(logMutex);
    outputLog += line;
}

std::string DashboardState::GetLogSnapshot() {
    std::lock_guard<std::mutex> lock(logMutex);
    return outputLog;
}

} // namespace equilibra::ui
