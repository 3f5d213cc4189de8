/**
 * @file CouncilAgents.cpp
 * @brief Heuristic rules of the four council agents.
 */

#include "domain/services/CouncilAgents.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace equilibra::domain::services {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string hours(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "h";
    return ss.str();
}

std::string percent(double rate) {
    return std::to_string(static_cast<int>(std::lround(rate * 100.0))) + "%";
}

AgentRecommendation vote(AgentRole role, CouncilAction action, std::string reasoning,
                         double confidence, CategoryWeights weights = {}) {
    AgentRecommendation r;
    r.agent = role;
    r.action = action;
    r.reasoning = std::move(reasoning);
    r.confidence = std::clamp(confidence, 0.0, 1.0);
    r.categoryWeights = std::move(weights);
    return r;
}

} // namespace

bool MentionsAny(const std::string& text, std::initializer_list<const char*> keywords) {
    const std::string haystack = lower(text);
    for (const char* keyword : keywords) {
        if (haystack.find(lower(keyword)) != std::string::npos) return true;
    }
    return false;
}

AgentRecommendation SleepSpecialistAgent::recommend(const CouncilContext& ctx) const {
    const double sleep = std::max(0.0, ctx.state.sleepHours);

    if (sleep < 6.0 && MentionsAny(ctx.activity, {"hiit", "intense"})) {
        return vote(role(), CouncilAction::Skip,
                    "Sleep debt detected (" + hours(sleep) +
                        "). High-intensity exercise increases cortisol and impairs recovery.",
                    0.95, {{HealthCategory::Recovery, 2.0}, {HealthCategory::Fitness, 0.3}});
    }
    if (sleep < 7.0) {
        return vote(role(), CouncilAction::Modify,
                    "Suboptimal sleep (" + hours(sleep) + "). Recommend lower intensity to preserve recovery capacity.",
                    0.75, {{HealthCategory::Recovery, 1.5}, {HealthCategory::Fitness, 0.7}});
    }
    return vote(role(), CouncilAction::Proceed,
                "Adequate sleep (" + hours(sleep) + "). Recovery capacity is good.", 0.80);
}

AgentRecommendation PerformanceCoachAgent::recommend(const CouncilContext& ctx) const {
    const int energy = std::clamp(ctx.state.energyLevel, 1, 10);
    const std::string level = "(" + std::to_string(energy) + "/10)";

    if (energy >= 7 && MentionsAny(ctx.activity, {"exercise", "work"})) {
        return vote(role(), CouncilAction::Proceed,
                    "High energy " + level + ". Optimal window for high-value activities aligned with goal: " + ctx.goal,
                    0.90, {{HealthCategory::Fitness, 1.4}});
    }
    if (energy <= 3) {
        return vote(role(), CouncilAction::Modify,
                    "Low energy " + level + ". Recommend strategic rest to prevent diminishing returns.",
                    0.70, {{HealthCategory::Recovery, 1.3}});
    }
    return vote(role(), CouncilAction::Proceed,
                "Moderate energy " + level + ". Maintain planned activities.", 0.60);
}

AgentRecommendation WellnessGuardianAgent::recommend(const CouncilContext& ctx) const {
    switch (ctx.state.stressLevel) {
        case StressLevel::High:
            if (MentionsAny(ctx.activity, {"work", "deadline"})) {
                return vote(role(), CouncilAction::Skip,
                            "High stress detected. Additional cognitive load risks burnout. "
                            "Recommend stress-reduction activities.",
                            0.85, {{HealthCategory::Mindfulness, 2.0}});
            }
            // Non-work activities under high stress are not cognitive load.
            break;
        case StressLevel::Medium:
            return vote(role(), CouncilAction::Modify,
                        "Moderate stress. Balance productivity with recovery activities.",
                        0.70, {{HealthCategory::Mindfulness, 1.3}});
        case StressLevel::Low:
            break;
    }
    return vote(role(), CouncilAction::Proceed, "Stress levels manageable. Maintain current balance.", 0.75);
}

double FutureSelfAgent::RecentSkipRate(const std::vector<TradeOffDecision>& history) {
    const size_t count = std::min(kLookback, history.size());
    if (count == 0) return 0.0;

    size_t withSkip = 0;
    for (size_t i = history.size() - count; i < history.size(); ++i) {
        if (history[i].hasAction(DecisionAction::Skip)) ++withSkip;
    }
    return static_cast<double>(withSkip) / static_cast<double>(count);
}

AgentRecommendation FutureSelfAgent::recommend(const CouncilContext& ctx) const {
    const double rate = RecentSkipRate(ctx.history);

    if (rate > 0.5) {
        return vote(role(), CouncilAction::Proceed,
                    "Skip rate is " + percent(rate) +
                        " this week. Skipping again risks habit collapse. Your future self needs consistency.",
                    0.90);
    }
    if (rate > 0.3) {
        return vote(role(), CouncilAction::Modify,
                    "Skip rate is " + percent(rate) + ". Consider a lighter version to maintain habit momentum.",
                    0.70);
    }
    return vote(role(), CouncilAction::Proceed,
                "Good consistency (" + percent(rate) + " skip rate). Your future self will thank you.", 0.80);
}

} // namespace equilibra::domain::services
