/**
 * @file TradeOffEngine.cpp
 * @brief Implementation of TradeOffEngine.
 */

#include "domain/services/TradeOffEngine.hpp"
#include "domain/services/PriorityMatrix.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>

namespace equilibra::domain::services {

namespace {

std::string formatHours(double hours) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << hours;
    return ss.str();
}

std::string joinCategories(const std::vector<HealthCategory>& categories) {
    std::string out;
    for (size_t i = 0; i < categories.size(); ++i) {
        if (i > 0) out += ", ";
        out += CategoryToString(categories[i]);
    }
    return out;
}

PlannedTask sanitized(PlannedTask task) {
    task.durationMinutes = std::max(1, task.durationMinutes);
    task.intensity = std::clamp(task.intensity, 0.0, 1.0);
    return task;
}

} // namespace

TradeOffEngine::TradeOffEngine(std::optional<CategoryWeights> preferences)
    : m_preferences(std::move(preferences)) {}

std::string TradeOffEngine::GenerateDecisionId() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dist(0, 0xFFFFFFFFu);
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", dist(rng));
    return buffer;
}

PlannedTask TradeOffEngine::MinimalVersion(const PlannedTask& task) {
    int minutes = 10;
    switch (task.category) {
        case HealthCategory::Fitness: minutes = 10; break;
        case HealthCategory::Nutrition: minutes = 5; break;
        case HealthCategory::Recovery: minutes = 10; break;
        case HealthCategory::Mindfulness: minutes = 5; break;
    }
    return {task.category, "Minimal " + task.name, minutes, 0.2,
            "Abbreviated version of: " + task.description};
}

double TradeOffEngine::ConfidenceFor(const ActiveConstraints& constraints) {
    if (constraints.empty()) return 0.95;
    return std::clamp(0.9 - constraints.meanSeverity() * 0.3, 0.5, 1.0);
}

TradeOffDecision TradeOffEngine::decide(const StateSnapshot& input,
                                        const ActiveConstraints& constraints,
                                        const std::vector<PlannedTask>& plannedTasks,
                                        std::chrono::system_clock::time_point now) const {
    const StateSnapshot state = input.clamped();

    TradeOffDecision decision;
    decision.id = GenerateDecisionId();
    decision.timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
    decision.state = state;
    for (const auto& c : constraints.items()) {
        decision.activeConstraints.push_back(c.kind);
    }

    PriorityResult priorities = PriorityMatrix::compute(constraints, m_preferences);
    decision.priorities = priorities.priorities;
    decision.priorityAdjustments = std::move(priorities.adjustments);

    // Descending priority; stable so ties keep base order.
    std::vector<HealthCategory> ranked(kAllCategories.begin(), kAllCategories.end());
    std::stable_sort(ranked.begin(), ranked.end(), [&](HealthCategory a, HealthCategory b) {
        return decision.priorities.at(a) > decision.priorities.at(b);
    });

    const double capacity = state.timeAvailableHours * 60.0 * (state.energyLevel / 10.0);
    double allocated = 0.0;

    for (auto category : ranked) {
        auto it = std::find_if(plannedTasks.begin(), plannedTasks.end(),
                               [category](const PlannedTask& t) { return t.category == category; });
        if (it == plannedTasks.end()) continue;

        const PlannedTask task = sanitized(*it);
        DomainDecision d = decideTask(task, decision.priorities.at(category), constraints,
                                      capacity - allocated, state);

        switch (d.action) {
            case DecisionAction::Prioritize:
            case DecisionAction::Maintain:
                allocated += task.durationMinutes;
                break;
            case DecisionAction::Downgrade:
                allocated += d.adjustedTask->durationMinutes;
                break;
            case DecisionAction::Defer:
            case DecisionAction::Skip:
                break;
        }
        decision.decisions.push_back(std::move(d));
    }

    decision.futureImpacts = futureImpacts(decision, state, constraints);
    decision.confidenceScore = ConfidenceFor(constraints);
    decision.reasoningSummary = summarize(decision, constraints);
    return decision;
}

DomainDecision TradeOffEngine::decideTask(const PlannedTask& task, double priority,
                                          const ActiveConstraints& constraints, double timeRemaining,
                                          const StateSnapshot& state) const {
    RuleOutcome outcome;
    const std::string categoryName = CategoryToString(task.category);

    if (timeRemaining < task.durationMinutes * kStarvationRatio) {
        if (priority >= kStarvationPriority) {
            outcome.action = DecisionAction::Downgrade;
            outcome.adjusted = MinimalVersion(task);
            outcome.reasoning = "Time critically limited but " + categoryName + " is high priority - minimal version";
        } else {
            outcome.action = DecisionAction::Skip;
            outcome.reasoning = "Insufficient time and " + categoryName + " not highest priority today";
        }
    } else {
        switch (task.category) {
            case HealthCategory::Fitness: outcome = decideFitness(task, constraints); break;
            case HealthCategory::Recovery: outcome = decideRecovery(constraints); break;
            case HealthCategory::Mindfulness: outcome = decideMindfulness(constraints, state); break;
            case HealthCategory::Nutrition: outcome = decideNutrition(constraints); break;
        }
    }

    if (outcome.action == DecisionAction::Maintain && priority >= kBoostPriority) {
        std::ostringstream ss;
        ss << "High adjusted priority (" << std::fixed << std::setprecision(2) << priority
           << ") - prioritizing " << categoryName;
        outcome.action = DecisionAction::Prioritize;
        outcome.reasoning = ss.str();
    }

    DomainDecision d;
    d.category = task.category;
    d.action = outcome.action;
    d.originalTask = task;
    if (outcome.action == DecisionAction::Downgrade) {
        d.adjustedTask = outcome.adjusted;
    }
    d.reasoning = outcome.reasoning.empty() ? "Standard execution of " + task.name : outcome.reasoning;
    d.priorityScore = priority;
    return d;
}

TradeOffEngine::RuleOutcome TradeOffEngine::decideFitness(const PlannedTask& task, const ActiveConstraints& c) {
    using K = ConstraintKind;
    if (c.has(K::BurnoutWarning)) {
        return {DecisionAction::Skip, std::nullopt,
                "Burnout risk detected - skipping workout to prioritize recovery"};
    }
    if (c.hasAny({K::CriticalSleep, K::CriticalEnergy})) {
        return {DecisionAction::Downgrade,
                PlannedTask{HealthCategory::Fitness, "Light stretching", 10, 0.2, "Gentle movement only"},
                "Critical fatigue - replacing with light stretching to maintain movement habit"};
    }
    if (c.has(K::HighStress) && c.has(K::LowSleep)) {
        return {DecisionAction::Downgrade,
                PlannedTask{HealthCategory::Fitness, "Recovery walk", 20, 0.3, "Low-intensity outdoor walk"},
                "High stress + poor sleep - replacing " + task.name + " with recovery walk"};
    }
    if (c.has(K::OvertrainingRisk)) {
        return {DecisionAction::Downgrade,
                PlannedTask{HealthCategory::Fitness, "Mobility work", 15, 0.25, "Active recovery mobility"},
                "Overtraining risk - substituting with mobility work for active recovery"};
    }
    if (c.has(K::LowEnergy)) {
        return {DecisionAction::Downgrade,
                PlannedTask{HealthCategory::Fitness, task.name + " (reduced intensity)", task.durationMinutes,
                            task.intensity * 0.6, "Lower intensity version: " + task.description},
                "Low energy - reducing workout intensity by 40%"};
    }
    return {DecisionAction::Maintain, std::nullopt, "Conditions favorable for planned workout"};
}

TradeOffEngine::RuleOutcome TradeOffEngine::decideRecovery(const ActiveConstraints& c) {
    using K = ConstraintKind;
    if (c.hasAny({K::CriticalSleep, K::BurnoutWarning, K::OvertrainingRisk})) {
        return {DecisionAction::Prioritize, std::nullopt,
                "Recovery critical due to active fatigue/burnout signals"};
    }
    if (c.has(K::TimeCritical)) {
        return {DecisionAction::Downgrade,
                PlannedTask{HealthCategory::Recovery, "Power nap", 20, 0.1, "Quick restorative rest"},
                "Time critical - condensed recovery with power nap"};
    }
    return {DecisionAction::Maintain, std::nullopt, "Recovery as planned"};
}

TradeOffEngine::RuleOutcome TradeOffEngine::decideMindfulness(const ActiveConstraints& c, const StateSnapshot& state) {
    using K = ConstraintKind;
    if (c.has(K::HighStress)) {
        return {DecisionAction::Prioritize, std::nullopt,
                "High stress detected - prioritizing mindfulness for stress reduction"};
    }
    if (c.has(K::TimeCritical)) {
        return {DecisionAction::Downgrade,
                PlannedTask{HealthCategory::Mindfulness, "Breathing exercise", 5, 0.2, "Quick box breathing"},
                "Time critical - condensed to 5-minute breathing exercise"};
    }
    if (state.energyLevel <= 3) {
        return {DecisionAction::Prioritize, std::nullopt,
                "Low energy state - meditation supports recovery without physical demand"};
    }
    return {DecisionAction::Maintain, std::nullopt, "Mindfulness as planned"};
}

TradeOffEngine::RuleOutcome TradeOffEngine::decideNutrition(const ActiveConstraints& c) {
    using K = ConstraintKind;
    if (c.has(K::TimeCritical)) {
        return {DecisionAction::Downgrade,
                PlannedTask{HealthCategory::Nutrition, "Simple healthy meal", 10, 0.1,
                            "Pre-prepared or quick healthy option"},
                "Time critical - simplify to pre-prepared healthy option rather than cooking"};
    }
    if (c.has(K::LowEnergy)) {
        // Same task, reasoning carries the focus change.
        return {DecisionAction::Maintain, std::nullopt,
                "Low energy - keep the meal but focus on complex carbs and lean protein"};
    }
    return {DecisionAction::Maintain, std::nullopt, "Nutrition plan as scheduled"};
}

std::vector<FutureImpact> TradeOffEngine::futureImpacts(const TradeOffDecision& decision,
                                                       const StateSnapshot& state,
                                                       const ActiveConstraints& constraints) {
    std::vector<FutureImpact> impacts;

    const DomainDecision* fitness = decision.decisionFor(HealthCategory::Fitness);
    if (fitness && (fitness->action == DecisionAction::Skip || fitness->action == DecisionAction::Downgrade)) {
        if (constraints.hasAny({ConstraintKind::BurnoutWarning, ConstraintKind::OvertrainingRisk})) {
            impacts.push_back({3, "intensity_reduction", "Reducing workout intensity to 60% for the next 3 days"});
        } else {
            impacts.push_back({1, "workout_reschedule", "Consider adding light activity tomorrow if energy improves"});
        }
    }

    if (state.sleepDebtHours > 4.0) {
        impacts.push_back({2, "sleep_extension",
                           "Recommend adding 30 min to sleep for 2 nights to address " +
                               formatHours(state.sleepDebtHours) + "h debt"});
    }

    if (constraints.has(ConstraintKind::BurnoutWarning)) {
        impacts.push_back({7, "deload_week", "Consider a deload week: reduce all fitness intensity by 50%"});
    }
    return impacts;
}

std::string TradeOffEngine::summarize(const TradeOffDecision& decision, const ActiveConstraints& constraints) {
    std::vector<HealthCategory> prioritized, downgraded, skipped;
    for (const auto& d : decision.decisions) {
        if (d.action == DecisionAction::Prioritize) prioritized.push_back(d.category);
        if (d.action == DecisionAction::Downgrade) downgraded.push_back(d.category);
        if (d.action == DecisionAction::Skip) skipped.push_back(d.category);
    }
    if (prioritized.empty() && downgraded.empty() && skipped.empty()) {
        return "All tasks maintained as planned.";
    }

    std::vector<std::string> parts;
    if (!constraints.empty()) {
        parts.push_back("given " + std::to_string(constraints.size()) + " active constraints");
    }
    if (!prioritized.empty()) parts.push_back("prioritized " + joinCategories(prioritized));
    if (!downgraded.empty()) parts.push_back("downgraded " + joinCategories(downgraded));
    if (!skipped.empty()) parts.push_back("skipped " + joinCategories(skipped));

    std::string summary;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) summary += "; ";
        summary += parts[i];
    }
    summary[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(summary[0])));
    return summary + ".";
}

} // namespace equilibra::domain::services
