/**
 * @file TradeOffEngine.hpp
 * @brief Core constraint-aware decision engine.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "domain/Constraint.hpp"
#include "domain/Decision.hpp"
#include "domain/HealthState.hpp"
#include "domain/PlannedTask.hpp"

namespace equilibra::domain::services {

/**
 * @class TradeOffEngine
 * @brief Ranks categories by adjusted priority, spends the effective time
 * capacity and emits one bounded action per planned category.
 *
 * Stateless apart from the user's category preferences; never reads or
 * writes history.
 */
class TradeOffEngine {
public:
    static constexpr double kStarvationRatio = 0.5;
    static constexpr double kStarvationPriority = 0.30;
    static constexpr double kBoostPriority = 0.35;

    explicit TradeOffEngine(std::optional<CategoryWeights> preferences = std::nullopt);

    /**
     * @brief Runs one decision cycle.
     * @param now Decision timestamp, truncated to milliseconds.
     */
    TradeOffDecision decide(const StateSnapshot& state,
                            const ActiveConstraints& constraints,
                            const std::vector<PlannedTask>& plannedTasks,
                            std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /** @brief Abbreviated task used when the remaining time is nearly gone. */
    static PlannedTask MinimalVersion(const PlannedTask& task);

    static double ConfidenceFor(const ActiveConstraints& constraints);

    static std::string GenerateDecisionId();

private:
    struct RuleOutcome {
        DecisionAction action = DecisionAction::Maintain;
        std::optional<PlannedTask> adjusted;
        std::string reasoning;
    };

    DomainDecision decideTask(const PlannedTask& task, double priority,
                              const ActiveConstraints& constraints, double timeRemaining,
                              const StateSnapshot& state) const;

    static RuleOutcome decideFitness(const PlannedTask& task, const ActiveConstraints& c);
    static RuleOutcome decideRecovery(const ActiveConstraints& c);
    static RuleOutcome decideMindfulness(const ActiveConstraints& c, const StateSnapshot& state);
    static RuleOutcome decideNutrition(const ActiveConstraints& c);

    static std::vector<FutureImpact> futureImpacts(const TradeOffDecision& decision,
                                                   const StateSnapshot& state,
                                                   const ActiveConstraints& constraints);
    static std::string summarize(const TradeOffDecision& decision, const ActiveConstraints& constraints);

    std::optional<CategoryWeights> m_preferences;
};

} // namespace equilibra::domain::services
