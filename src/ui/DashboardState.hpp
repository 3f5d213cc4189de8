/**
 * @file DashboardState.hpp
 * @brief State shared between the dashboard renderer and background jobs.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "domain/PlannedTask.hpp"
#include "domain/services/HealthCouncil.hpp"
#include "domain/services/PlanAdjuster.hpp"

namespace equilibra::ui {

/**
 * @struct StateInputs
 * @brief Widget-backed buffers for the Daily Decision tab.
 */
struct StateInputs {
    float sleepHours = 7.0f;
    int energyLevel = 6;
    int stressIndex = 1;             ///< 0 LOW, 1 MEDIUM, 2 HIGH.
    float timeAvailableHours = 2.0f;
    float sleepDebtHours = 0.0f;
    int consecutiveHighEffortDays = 0;

    domain::StateSnapshot ToSnapshot() const;
};

struct CouncilInputs {
    char activity[128] = "HIIT workout";
    char goal[128] = "";
    bool parallel = true;
};

struct SimulationInputs {
    int scenarioIndex = 0;
    int days = 7;
    float timeAvailableHours = 2.0f;
};

/**
 * @struct DashboardResults
 * @brief Latest engine output. Written by background jobs, read each frame;
 * guarded by DashboardState::resultsMutex.
 */
struct DashboardResults {
    std::optional<application::CycleResult> lastCycle;
    std::optional<domain::services::PlanAdjustment> lastAdjustment;
    std::optional<domain::ConsensusDecision> consensus;
    std::optional<domain::BurnoutForecast> forecast;
    std::optional<domain::WeeklyAdjustmentReport> weeklyReport;
    std::string weeklyInsight;
    std::optional<domain::DecisionStatistics> statistics;
    std::vector<application::SimulatedDay> simulationDays;
    std::optional<application::SimulationRun> simulation;
    std::string lastExportPath;
};

/**
 * @struct DashboardState
 * @brief Everything the renderer needs, plus the actions it can trigger.
 */
struct DashboardState {
    application::AppServices services;

    StateInputs inputs;
    std::vector<domain::PlannedTask> plannedTasks = domain::SamplePlannedTasks();
    CouncilInputs council;
    SimulationInputs simulation;

    DashboardResults results;
    std::mutex resultsMutex;

    std::string outputLog;
    std::mutex logMutex;

    bool requestExit = false;

    /** @brief True while a job of this type is queued or running. */
    bool IsBusy(application::TaskType type);

    DashboardState();
    /** @brief Drains background jobs first; they capture this state. */
    ~DashboardState();

    /** @brief Injects the required services into the state. */
    void InjectServices(application::AppServices&& newServices);

    /** @brief Runs a decision cycle plus plan adjustment in the background. */
    void RunDecision();
    /** @brief Asks the council about the activity in the council inputs. */
    void ConsultCouncil();
    /** @brief Recomputes forecast, weekly report, insight and statistics in the background. */
    void RefreshInsights();
    /** @brief Runs the selected scenario, streaming days into results. */
    void RunSimulation();
    void ExportSession();
    void ClearHistory();

    /** @brief Thread-safe log append. */
    void AppendLog(const std::string& line);
    /** @brief Thread-safe log retrieval. */
    std::string GetLogSnapshot();
};

} // namespace equilibra::ui
