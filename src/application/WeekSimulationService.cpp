/**
 * @file WeekSimulationService.cpp
 * @brief Implementation of WeekSimulationService.
 */

#include "application/WeekSimulationService.hpp"
#include "application/DecisionCycleService.hpp"
#include "domain/PlannedTask.hpp"
#include "infrastructure/InMemoryHistoryRepository.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace equilibra::application {

using namespace equilibra::domain;

WeekSimulationService::WeekSimulationService(std::shared_ptr<NarrativeService> narrative,
                                             ConstraintThresholds thresholds,
                                             CategoryWeights preferences)
    : m_narrative(std::move(narrative)), m_thresholds(thresholds), m_preferences(std::move(preferences)) {}

const std::vector<SimulationScenario>& WeekSimulationService::Scenarios() {
    static const std::vector<SimulationScenario> scenarios = {
        {"burnout_recovery", "Burnout to Recovery", "Start stressed, watch the engine enforce recovery",
         {0.9, 0.85, 0.7, 0.5, 0.4, 0.25, 0.15},
         {0.9, 0.8, 0.65, 0.5, 0.35, 0.25, 0.2}},
        {"gradual_burnout", "Gradual Burnout", "Watch the engine detect and contain rising strain",
         {0.2, 0.3, 0.45, 0.6, 0.75, 0.85, 0.9},
         {0.2, 0.3, 0.4, 0.55, 0.7, 0.8, 0.85}},
        {"weekend_warrior", "Weekend Warrior", "Draining weekdays, fresh weekends",
         {0.6, 0.65, 0.7, 0.75, 0.5, 0.2, 0.3},
         {0.6, 0.65, 0.6, 0.65, 0.4, 0.15, 0.2}},
        {"high_performer", "High Performer", "Consistently good state",
         {0.15, 0.2, 0.15, 0.25, 0.2, 0.1, 0.15},
         {0.2, 0.25, 0.2, 0.3, 0.2, 0.15, 0.2}}
    };
    return scenarios;
}

std::optional<SimulationScenario> WeekSimulationService::FindScenario(const std::string& key) {
    for (const auto& s : Scenarios()) {
        if (s.key == key) return s;
    }
    return std::nullopt;
}

StateSnapshot WeekSimulationService::SnapshotFor(double fatigue, double stress, double timeAvailableHours) {
    fatigue = std::clamp(fatigue, 0.0, 1.0);
    stress = std::clamp(stress, 0.0, 1.0);

    StateSnapshot s;
    s.sleepHours = 8.0 - 4.0 * fatigue;
    s.energyLevel = std::clamp(static_cast<int>(std::lround(9.0 - 7.0 * fatigue)), 1, 10);
    s.stressLevel = stress >= 0.65 ? StressLevel::High : stress >= 0.35 ? StressLevel::Medium : StressLevel::Low;
    s.timeAvailableHours = std::max(0.0, timeAvailableHours);

    // Wearable-style extras so readiness has something to show.
    s.sleepQuality = 90.0 - 50.0 * fatigue;
    s.hrvMs = 70.0 - 45.0 * fatigue;
    s.restingHeartRate = static_cast<int>(std::lround(55.0 + 20.0 * stress));
    return s;
}

bool WeekSimulationService::IsHighEffortDay(const TradeOffDecision& decision) {
    const DomainDecision* fitness = decision.decisionFor(HealthCategory::Fitness);
    if (!fitness) return false;
    if (fitness->action != DecisionAction::Prioritize && fitness->action != DecisionAction::Maintain) return false;
    return fitness->originalTask.intensity >= kHighEffortIntensity;
}

SimulationRun WeekSimulationService::Run(const std::string& scenarioKey,
                                         int days,
                                         double timeAvailableHours,
                                         std::chrono::system_clock::time_point start,
                                         const DayCallback& onDay) const {
    SimulationRun run;
    auto scenario = FindScenario(scenarioKey);
    if (!scenario) {
        std::cerr << "[WeekSimulationService] Unknown scenario '" << scenarioKey
                  << "', using burnout_recovery" << std::endl;
        scenario = Scenarios().front();
    }
    run.scenario = *scenario;

    auto repository = std::make_shared<infrastructure::InMemoryHistoryRepository>();
    UserProfile profile;
    profile.thresholds = m_thresholds;
    profile.preferences = m_preferences;
    repository->saveProfile(profile);
    DecisionCycleService cycle(repository, m_narrative, nullptr);

    const auto tasks = SamplePlannedTasks();
    const int totalDays = std::max(1, days);
    double sleepDebt = 0.0;
    int highEffortStreak = 0;
    auto now = start;

    for (int d = 0; d < totalDays; ++d) {
        now = start + std::chrono::hours(24 * d);

        StateSnapshot state = SnapshotFor(run.scenario.fatigue[d % 7], run.scenario.stress[d % 7], timeAvailableHours);
        if (state.sleepHours >= kFullNightHours) {
            sleepDebt = std::max(0.0, sleepDebt - kDebtRecoveryPerNight);
        } else {
            sleepDebt += kFullNightHours - state.sleepHours;
        }
        state.sleepDebtHours = sleepDebt;
        state.consecutiveHighEffortDays = highEffortStreak;
        state.timestamp = now;

        auto result = cycle.RunCycle(state, tasks, m_narrative != nullptr, now);

        SimulatedDay day;
        day.day = d + 1;
        day.state = result.decision.state;
        day.decision = result.decision;
        day.narrative = result.narrative;
        day.readiness = day.state.readinessScore();
        day.adaptations = cycle.AdjustPlan(result.decision, tasks, now).adaptations;

        highEffortStreak = IsHighEffortDay(result.decision) ? highEffortStreak + 1 : 0;

        if (onDay) onDay(day);
        run.days.push_back(std::move(day));
    }

    run.forecast = cycle.ForecastBurnout(now);
    run.report = cycle.WeeklyReport(now);

    std::cout << "[WeekSimulationService] " << run.scenario.key << ": " << run.days.size()
              << " days, burnout risk " << run.forecast.riskScore << " ("
              << SeverityToString(run.forecast.severity) << ")" << std::endl;
    return run;
}

} // namespace equilibra::application
