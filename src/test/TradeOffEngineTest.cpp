#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include "domain/services/ConstraintEvaluator.hpp"
#include "domain/services/PriorityMatrix.hpp"
#include "domain/services/TradeOffEngine.hpp"

using namespace equilibra::domain;
using equilibra::domain::services::ConstraintEvaluator;
using equilibra::domain::services::PriorityMatrix;
using equilibra::domain::services::TradeOffEngine;

namespace {

StateSnapshot makeState(double sleep, int energy, StressLevel stress, double hours) {
    StateSnapshot s;
    s.sleepHours = sleep;
    s.energyLevel = energy;
    s.stressLevel = stress;
    s.timeAvailableHours = hours;
    return s;
}

TradeOffDecision run(const StateSnapshot& s, const std::vector<PlannedTask>& tasks = SamplePlannedTasks()) {
    TradeOffEngine engine;
    return engine.decide(s, ConstraintEvaluator::evaluate(s), tasks);
}

void checkShape(const TradeOffDecision& d) {
    double sum = 0.0;
    assert(d.priorities.size() == 4);
    for (const auto& [category, value] : d.priorities) {
        assert(value >= PriorityMatrix::kFloor - 1e-9);
        sum += value;
    }
    assert(std::fabs(sum - 1.0) < 1e-9);
    assert(d.confidenceScore >= 0.0 && d.confidenceScore <= 1.0);
    assert(d.id.size() == 8);
    for (const auto& dec : d.decisions) {
        assert((dec.action == DecisionAction::Downgrade) == dec.adjustedTask.has_value());
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting TradeOffEngine Test..." << std::endl;

    std::cout << "[Test] Priority floor over every constraint subset..." << std::endl;
    constexpr int kinds = static_cast<int>(sizeof(kAllConstraintKinds) / sizeof(kAllConstraintKinds[0]));
    for (int mask = 0; mask < (1 << kinds); ++mask) {
        ActiveConstraints c;
        for (int i = 0; i < kinds; ++i) {
            if (mask & (1 << i)) c.add(kAllConstraintKinds[i], 1.0, ConstraintSource::Derived);
        }
        auto result = PriorityMatrix::compute(c);
        double sum = 0.0;
        for (auto category : kAllCategories) {
            assert(result.priorities.at(category) >= PriorityMatrix::kFloor - 1e-9);
            sum += result.priorities.at(category);
        }
        assert(std::fabs(sum - 1.0) < 1e-9);
    }

    // Degenerate raw weights still normalize.
    {
        CategoryWeights zeros;
        for (auto category : kAllCategories) zeros[category] = 0.0;
        auto out = PriorityMatrix::normalizeWithFloor(zeros);
        for (auto category : kAllCategories) assert(std::fabs(out.at(category) - 0.25) < 1e-9);
    }

    // Preferences pull the distribution toward the user's weights.
    {
        CategoryWeights prefs = {{HealthCategory::Fitness, 0.7}, {HealthCategory::Recovery, 0.1},
                                 {HealthCategory::Nutrition, 0.1}, {HealthCategory::Mindfulness, 0.1}};
        auto plain = PriorityMatrix::compute(ActiveConstraints{});
        auto blended = PriorityMatrix::compute(ActiveConstraints{}, prefs);
        assert(blended.priorities.at(HealthCategory::Fitness) > plain.priorities.at(HealthCategory::Fitness));
        bool sawPreference = false;
        for (const auto& adj : blended.adjustments) {
            if (adj.source == "user_preference") sawPreference = true;
        }
        assert(sawPreference);
    }

    std::cout << "[Test] Exhausted and stressed..." << std::endl;
    {
        auto d = run(makeState(4.5, 3, StressLevel::High, 1.0));
        checkShape(d);
        assert(d.hasConstraint(ConstraintKind::BurnoutWarning));
        const auto* fitness = d.decisionFor(HealthCategory::Fitness);
        assert(fitness && fitness->action == DecisionAction::Skip);
        const auto* recovery = d.decisionFor(HealthCategory::Recovery);
        assert(recovery && recovery->action == DecisionAction::Prioritize);

        bool deload = false;
        for (const auto& impact : d.futureImpacts) {
            if (impact.adjustmentType == "deload_week") deload = true;
        }
        assert(deload);
        assert(d.confidenceScore < 0.95);
    }

    {
        auto s = makeState(4.0, 2, StressLevel::High, 1.0);
        s.consecutiveHighEffortDays = 4;
        auto d = run(s);
        checkShape(d);
        for (auto kind : {ConstraintKind::CriticalSleep, ConstraintKind::CriticalEnergy, ConstraintKind::HighStress,
                          ConstraintKind::OvertrainingRisk, ConstraintKind::BurnoutWarning}) {
            assert(d.hasConstraint(kind));
        }
        assert(d.decisionFor(HealthCategory::Fitness)->action == DecisionAction::Skip);
        // Twelve minutes of capacity: recovery survives as its minimal version.
        assert(d.decisionFor(HealthCategory::Recovery)->action == DecisionAction::Downgrade);
        assert(d.decisionFor(HealthCategory::Recovery)->adjustedTask->name == "Minimal Sleep Optimization");
    }

    std::cout << "[Test] Well rested with plenty of time..." << std::endl;
    {
        auto d = run(makeState(8.0, 9, StressLevel::Low, 4.0));
        checkShape(d);
        assert(d.activeConstraints.empty());
        assert(!d.hasAction(DecisionAction::Skip));
        assert(d.decisions.size() == 4);
        assert(d.reasoningSummary == "All tasks maintained as planned.");
        assert(std::fabs(d.confidenceScore - 0.95) < 1e-9);
    }

    std::cout << "[Test] Fifteen minutes available..." << std::endl;
    {
        auto d = run(makeState(7.0, 6, StressLevel::Medium, 0.25));
        checkShape(d);
        assert(d.hasConstraint(ConstraintKind::TimeCritical));
        int reduced = 0;
        for (const auto& dec : d.decisions) {
            if (dec.action == DecisionAction::Downgrade || dec.action == DecisionAction::Skip) ++reduced;
        }
        assert(reduced >= 2);
        // Highest priority first.
        for (size_t i = 1; i < d.decisions.size(); ++i) {
            assert(d.decisions[i - 1].priorityScore >= d.decisions[i].priorityScore);
        }
        assert(d.reasoningSummary.find("1 active constraints") != std::string::npos);
    }

    // Low energy keeps the workout but at 60% intensity.
    {
        auto d = run(makeState(8.0, 4, StressLevel::Low, 8.0));
        checkShape(d);
        const auto* fitness = d.decisionFor(HealthCategory::Fitness);
        assert(fitness && fitness->action == DecisionAction::Downgrade);
        assert(std::fabs(fitness->adjustedTask->intensity - 0.8 * 0.6) < 1e-9);
        const auto* nutrition = d.decisionFor(HealthCategory::Nutrition);
        assert(nutrition && !nutrition->adjustedTask);
    }

    std::cout << "[Test] Time accounting..." << std::endl;
    {
        // 90 minutes of capacity: recovery and the meal use it all up.
        auto d = run(makeState(8.0, 10, StressLevel::Low, 1.5));
        checkShape(d);
        assert(d.decisionFor(HealthCategory::Recovery)->action == DecisionAction::Maintain);
        assert(d.decisionFor(HealthCategory::Nutrition)->action == DecisionAction::Maintain);
        assert(d.decisionFor(HealthCategory::Fitness)->action == DecisionAction::Skip);
        assert(d.decisionFor(HealthCategory::Mindfulness)->action == DecisionAction::Skip);

        // A skipped task consumes nothing, leaving room for the ones after it.
        auto tasks = SamplePlannedTasks();
        tasks[1].durationMinutes = 200;
        d = run(makeState(8.0, 10, StressLevel::Low, 1.5), tasks);
        assert(d.decisionFor(HealthCategory::Nutrition)->action == DecisionAction::Skip);
        assert(d.decisionFor(HealthCategory::Fitness)->action == DecisionAction::Maintain);
        assert(d.decisionFor(HealthCategory::Mindfulness)->action == DecisionAction::Maintain);
    }

    // Only planned categories get a decision; no tasks means an empty, maintained decision.
    {
        std::vector<PlannedTask> onlyMeditation = {
            {HealthCategory::Mindfulness, "Meditation", 10, 0.2, "Short sit"}};
        auto d = run(makeState(8.0, 8, StressLevel::Low, 2.0), onlyMeditation);
        assert(d.decisions.size() == 1);
        assert(d.decisionFor(HealthCategory::Fitness) == nullptr);

        auto empty = run(makeState(8.0, 8, StressLevel::Low, 2.0), {});
        assert(empty.decisions.empty());
        assert(empty.reasoningSummary == "All tasks maintained as planned.");
    }

    // Sanity across a grid of states.
    for (double sleep : {3.0, 5.5, 7.5}) {
        for (int energy : {1, 4, 7, 10}) {
            for (auto stress : {StressLevel::Low, StressLevel::High}) {
                for (double hours : {0.0, 0.75, 3.0}) {
                    checkShape(run(makeState(sleep, energy, stress, hours)));
                }
            }
        }
    }

    auto minimal = TradeOffEngine::MinimalVersion(SamplePlannedTasks()[1]);
    assert(minimal.durationMinutes == 5);
    assert(minimal.name == "Minimal Meal Prep");

    std::cout << "[PASS] TradeOffEngine Test Passed" << std::endl;
    return 0;
}
