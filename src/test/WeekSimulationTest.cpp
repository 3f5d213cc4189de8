#undef NDEBUG
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include "application/DecisionCycleService.hpp"
#include "application/TemplateNarrativeService.hpp"
#include "application/WeekSimulationService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InMemoryHistoryRepository.hpp"
#include "infrastructure/JsonCodec.hpp"

using namespace equilibra::domain;
using equilibra::application::DecisionCycleService;
using equilibra::application::SimulatedDay;
using equilibra::application::TemplateNarrativeService;
using equilibra::application::WeekSimulationService;

namespace {

int severityRank(RiskSeverity s) { return static_cast<int>(s); }

} // namespace

int main() {
    std::cout << "[Test] Starting Week Simulation Test..." << std::endl;
    const auto start = std::chrono::system_clock::now();

    assert(WeekSimulationService::Scenarios().size() == 4);
    assert(WeekSimulationService::FindScenario("weekend_warrior"));
    assert(!WeekSimulationService::FindScenario("moonwalk"));

    WeekSimulationService simulator(std::make_shared<TemplateNarrativeService>());

    std::cout << "[Test] Burnout to recovery..." << std::endl;
    {
        int callbacks = 0;
        auto run = simulator.Run("burnout_recovery", 7, 2.0, start,
                                 [&callbacks](const SimulatedDay& day) {
                                     ++callbacks;
                                     assert(day.day == callbacks);
                                 });
        assert(callbacks == 7);
        assert(run.days.size() == 7);

        const auto& first = run.days.front();
        assert(first.decision.hasConstraint(ConstraintKind::BurnoutWarning));
        const auto* fitness = first.decision.decisionFor(HealthCategory::Fitness);
        assert(fitness && fitness->action == DecisionAction::Skip);
        assert(first.narrative.has_value());

        // Recovering days carry fewer constraints than the first one.
        assert(run.days.back().decision.activeConstraints.size() < first.decision.activeConstraints.size());

        for (size_t i = 0; i < run.days.size(); ++i) {
            assert(run.days[i].readiness >= 0 && run.days[i].readiness <= 100);
            if (i > 0) assert(run.days[i - 1].decision.timestamp < run.days[i].decision.timestamp);
        }
        assert(run.days.back().readiness > first.readiness);
        assert(run.report.status == PatternStatus::Ok);
        assert(run.report.totalDecisions == 7);
    }

    std::cout << "[Test] Gradual burnout against a high performer..." << std::endl;
    {
        auto rising = simulator.Run("gradual_burnout", 7, 2.0, start);
        auto steady = simulator.Run("high_performer", 7, 2.0, start);

        for (const auto& day : steady.days) {
            assert(day.decision.activeConstraints.empty());
        }
        assert(steady.forecast.severity == RiskSeverity::Low);

        assert(severityRank(rising.forecast.severity) >= severityRank(RiskSeverity::High));
        assert(rising.forecast.riskScore > steady.forecast.riskScore);
        assert(rising.days.back().decision.hasConstraint(ConstraintKind::HighStress));
        assert(rising.days.front().decision.activeConstraints.size() <
               rising.days.back().decision.activeConstraints.size());
    }

    std::cout << "[Test] Simulated days decide like the interactive cycle..." << std::endl;
    {
        assert(UserProfile{}.preferences == UniformCategoryWeights());

        const equilibra::infrastructure::AppConfig config;
        WeekSimulationService configured(nullptr, config.thresholds, config.preferences);

        auto repository = std::make_shared<equilibra::infrastructure::InMemoryHistoryRepository>();
        UserProfile profile;
        profile.thresholds = config.thresholds;
        profile.preferences = config.preferences;
        repository->saveProfile(profile);
        DecisionCycleService interactive(repository, nullptr, nullptr);

        for (const auto& scenario : WeekSimulationService::Scenarios()) {
            for (double hours : {0.25, 1.0, 2.0}) {
                auto run = configured.Run(scenario.key, 7, hours, start);
                for (const auto& day : run.days) {
                    const auto live = interactive.RunCycle(day.state, SamplePlannedTasks(), false,
                                                           day.decision.timestamp).decision;
                    assert(live.priorities == day.decision.priorities);
                    assert(live.decisions.size() == day.decision.decisions.size());
                    for (size_t i = 0; i < live.decisions.size(); ++i) {
                        assert(live.decisions[i].category == day.decision.decisions[i].category);
                        assert(live.decisions[i].action == day.decision.decisions[i].action);
                    }
                }
            }
        }

        // Profiles without a preferences entry still blend at 0.25 each.
        auto loaded = equilibra::infrastructure::json::object().get<UserProfile>();
        assert(loaded.preferences == UniformCategoryWeights());
    }

    // Unknown scenario falls back; longer runs wrap the weekly curve.
    {
        WeekSimulationService quiet;
        auto run = quiet.Run("moonwalk", 10, 2.0, start);
        assert(run.scenario.key == "burnout_recovery");
        assert(run.days.size() == 10);
        assert(!run.days.front().narrative.has_value());
    }

    // Snapshot mapping stays in range at the extremes.
    {
        auto worst = WeekSimulationService::SnapshotFor(2.0, 2.0, -1.0);
        assert(worst.energyLevel >= 1 && worst.energyLevel <= 10);
        assert(worst.sleepHours == 4.0);
        assert(worst.stressLevel == StressLevel::High);
        assert(worst.timeAvailableHours == 0.0);
        auto best = WeekSimulationService::SnapshotFor(0.0, 0.0, 3.0);
        assert(best.energyLevel == 9);
        assert(best.stressLevel == StressLevel::Low);
    }

    std::cout << "[PASS] Week Simulation Test Passed" << std::endl;
    return 0;
}
