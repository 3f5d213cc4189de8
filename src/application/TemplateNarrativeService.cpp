/**
 * @file TemplateNarrativeService.cpp
 * @brief Implementation of TemplateNarrativeService.
 */

#include "application/TemplateNarrativeService.hpp"
#include <algorithm>
#include <sstream>

namespace equilibra::application {

using namespace equilibra::domain;

std::string TemplateNarrativeService::joinCategories(const TradeOffDecision& decision, DecisionAction action) {
    std::string out;
    for (const auto& d : decision.decisions) {
        if (d.action != action) continue;
        if (!out.empty()) out += ", ";
        out += CategoryToString(d.category);
    }
    return out;
}

std::string TemplateNarrativeService::temporalAnalysis(const TradeOffDecision& decision) {
    if (decision.futureImpacts.empty()) {
        return "Urgency: Low. Recommendation: Consistent routine detected.";
    }
    int horizon = 0;
    for (const auto& impact : decision.futureImpacts) {
        horizon = std::max(horizon, impact.daysAffected);
    }
    std::ostringstream ss;
    ss << (horizon >= 7 ? "Urgency: High. " : horizon >= 3 ? "Urgency: Moderate. " : "Urgency: Low. ")
       << "Recommendation: " << decision.futureImpacts.front().description;
    if (decision.futureImpacts.size() > 1) {
        ss << " (+" << decision.futureImpacts.size() - 1 << " more adjustment"
           << (decision.futureImpacts.size() > 2 ? "s" : "") << " over the next " << horizon << " days)";
    }
    return ss.str();
}

std::string TemplateNarrativeService::contextAssessment(const TradeOffDecision& decision) {
    if (decision.hasConstraint(ConstraintKind::BurnoutWarning)) {
        return "Risk Level: High. Several strain signals at once; protect recovery before adding load.";
    }
    if (decision.activeConstraints.size() >= 2) {
        return "Risk Level: Moderate. Multiple constraints active; keep effort flexible today.";
    }
    if (!decision.activeConstraints.empty()) {
        return "Risk Level: Low. One constraint active: " + ConstraintDescription(decision.activeConstraints.front()) + ".";
    }
    return "Risk Level: Low. Conditions favorable for planned activities.";
}

DecisionNarrative TemplateNarrativeService::explainDecision(const TradeOffDecision& decision) {
    std::vector<std::string> parts;

    const auto& s = decision.state;
    if (s.sleepHours < 6.0 || s.energyLevel < 4) {
        parts.push_back("You're running on low reserves today.");
    } else if (s.stressLevel == StressLevel::High) {
        parts.push_back("Stress is weighing on you today.");
    } else {
        parts.push_back("Based on your current state, the plan mostly holds.");
    }

    const std::string prioritized = joinCategories(decision, DecisionAction::Prioritize);
    if (!prioritized.empty()) {
        parts.push_back("Prioritized " + prioritized + " for the biggest benefit.");
    }
    const std::string downgraded = joinCategories(decision, DecisionAction::Downgrade);
    if (!downgraded.empty()) {
        parts.push_back("Scaled back " + downgraded + " to fit your capacity.");
    }
    const std::string skipped = joinCategories(decision, DecisionAction::Skip);
    if (!skipped.empty()) {
        parts.push_back("Skipping " + skipped + " today is fine; rest is productive too.");
    }

    std::string explanation;
    for (const auto& p : parts) {
        if (!explanation.empty()) explanation += " ";
        explanation += p;
    }

    DecisionNarrative narrative;
    narrative.explanation = explanation;
    narrative.temporalAnalysis = temporalAnalysis(decision);
    narrative.contextAssessment = contextAssessment(decision);
    narrative.generatedByModel = false;
    return narrative;
}

std::string TemplateNarrativeService::weeklyInsight(const WeeklyAdjustmentReport& report) {
    if (report.status == PatternStatus::InsufficientData || report.categories.empty()) {
        return "Weekly Insight: not enough decisions this week to spot patterns yet.";
    }

    auto best = report.categories.begin();
    auto worst = report.categories.begin();
    for (auto it = report.categories.begin(); it != report.categories.end(); ++it) {
        if (it->second.skipRate < best->second.skipRate) best = it;
        if (it->second.skipRate > worst->second.skipRate) worst = it;
    }

    std::string out = "Weekly Insight: Great job staying consistent with " + CategoryToString(best->first) + ".";
    if (worst->second.skipRate > 30.0) {
        out += " Consider adjusting your " + CategoryToString(worst->first) + " goals to be more achievable.";
    }
    if (!report.recommendations.empty()) {
        out += " " + report.recommendations.front();
    }
    out += " Consistency over perfection.";
    return out;
}

} // namespace equilibra::application
