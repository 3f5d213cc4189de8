#undef NDEBUG
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include "domain/services/PatternDetector.hpp"
#include "domain/services/PlanAdjuster.hpp"

using namespace equilibra::domain;
using namespace equilibra::domain::services;

namespace {

using Clock = std::chrono::system_clock;

TradeOffDecision dayWith(Clock::time_point when, DecisionAction mindfulness,
                         std::vector<ConstraintKind> constraints = {}) {
    TradeOffDecision d;
    d.timestamp = when;
    d.activeConstraints = std::move(constraints);
    DomainDecision fitness;
    fitness.category = HealthCategory::Fitness;
    fitness.action = DecisionAction::Maintain;
    DomainDecision mind;
    mind.category = HealthCategory::Mindfulness;
    mind.action = mindfulness;
    d.decisions = {fitness, mind};
    return d;
}

const PlannedTask* find(const std::vector<PlannedTask>& tasks, HealthCategory category) {
    for (const auto& t : tasks) {
        if (t.category == category) return &t;
    }
    return nullptr;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PlanAdjuster Test..." << std::endl;
    const auto now = Clock::now();
    const auto day = std::chrono::hours(24);
    PlanAdjuster adjuster;

    std::cout << "[Test] Mindfulness skipped five days out of seven..." << std::endl;
    std::vector<TradeOffDecision> history;
    for (int i = 0; i < 7; ++i) {
        history.push_back(dayWith(now - day * (6 - i), i < 5 ? DecisionAction::Skip : DecisionAction::Maintain));
    }
    {
        PatternDetector detector(history, 7, now);
        assert(detector.status() == PatternStatus::Ok);
        assert(std::fabs(detector.skipFrequency(HealthCategory::Mindfulness) - 5.0 / 7.0) < 1e-9);
        assert(detector.skipFrequency(HealthCategory::Fitness) == 0.0);

        TradeOffDecision current = dayWith(now, DecisionAction::Maintain);
        auto result = adjuster.adjustFuturePlan(current, SamplePlannedTasks(), history, now);

        const PlannedTask* mind = find(result.tasks, HealthCategory::Mindfulness);
        assert(mind);
        assert(mind->name == "Flexible Meditation Session");
        assert(mind->durationMinutes == 14);
        assert(std::fabs(mind->intensity - 0.2 * 0.7) < 1e-9);

        assert(result.adaptations.size() == 1);
        const auto& record = result.adaptations.front();
        assert(record.patternDetected == "consistent_skip_mindfulness");
        assert(record.affectedCategories.size() == 1 && record.affectedCategories[0] == HealthCategory::Mindfulness);
        assert(record.reasoning.find("71%") != std::string::npos);

        // Other tasks untouched.
        assert(find(result.tasks, HealthCategory::Fitness)->intensity == 0.8);

        auto report = adjuster.weeklyReport(history, 1, now);
        assert(report.status == PatternStatus::Ok);
        assert(report.totalDecisions == 7);
        assert(report.adaptationsMade == 1);
        assert(std::fabs(report.categories.at(HealthCategory::Mindfulness).skipRate - 71.4) < 1e-9);
        assert(!report.recommendations.empty());
        assert(report.recommendations.front().find("mindfulness") != std::string::npos);
    }

    std::cout << "[Test] Not enough history..." << std::endl;
    {
        std::vector<TradeOffDecision> shortHistory(history.end() - 2, history.end());
        TradeOffDecision current = dayWith(now, DecisionAction::Maintain);
        auto result = adjuster.adjustFuturePlan(current, SamplePlannedTasks(), shortHistory, now);
        assert(result.adaptations.empty());
        assert(find(result.tasks, HealthCategory::Mindfulness)->name == "Meditation Session");

        auto report = adjuster.weeklyReport(shortHistory, 0, now);
        assert(report.status == PatternStatus::InsufficientData);
        assert(report.totalDecisions == 2);
        assert(report.recommendations.empty());
    }

    std::cout << "[Test] Intensity reduction after a skipped workout..." << std::endl;
    {
        TradeOffDecision current = dayWith(now, DecisionAction::Maintain);
        current.decisions[0].action = DecisionAction::Skip;
        current.futureImpacts.push_back({3, "intensity_reduction", "Reduce"});

        auto result = adjuster.adjustFuturePlan(current, SamplePlannedTasks(), {}, now);
        assert(result.adaptations.size() == 1);
        assert(result.adaptations[0].patternDetected == "high_fatigue_signals");
        assert(result.adaptations[0].adaptationMade == "Reduced all workout intensities to 60%");

        const PlannedTask* fitness = find(result.tasks, HealthCategory::Fitness);
        assert(fitness->name == "Recovery workout");
        assert(fitness->durationMinutes == 30);
        assert(std::fabs(fitness->intensity - 0.4) < 1e-9);
        assert(std::fabs(find(result.tasks, HealthCategory::Nutrition)->intensity - 0.3 * 0.6) < 1e-9);
    }

    std::cout << "[Test] Chronic stress..." << std::endl;
    {
        std::vector<TradeOffDecision> stressed;
        for (int i = 0; i < 4; ++i) {
            stressed.push_back(dayWith(now - day * i, DecisionAction::Prioritize, {ConstraintKind::HighStress}));
        }
        auto result = adjuster.adjustFuturePlan(dayWith(now, DecisionAction::Maintain), SamplePlannedTasks(),
                                                stressed, now);
        bool chronic = false;
        for (const auto& r : result.adaptations) {
            if (r.patternDetected == "chronic_high_stress") chronic = true;
        }
        assert(chronic);

        auto report = adjuster.weeklyReport(stressed, 0, now);
        assert(report.constraintFrequency.at("high_stress") == 4);
    }

    // Weekdays are Monday based.
    assert(PatternDetector::WeekdayIndex(Clock::time_point{}) == 3);
    assert(PatternDetector::WeekdayIndex(Clock::time_point{} + day * 4) == 0);

    std::cout << "[PASS] PlanAdjuster Test Passed" << std::endl;
    return 0;
}
