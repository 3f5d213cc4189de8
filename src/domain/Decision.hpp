/**
 * @file Decision.hpp
 * @brief Records produced by one trade-off decision cycle.
 */

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/Category.hpp"
#include "domain/Constraint.hpp"
#include "domain/HealthState.hpp"
#include "domain/PlannedTask.hpp"

namespace equilibra::domain {

/**
 * @enum DecisionAction
 * @brief Bounded action taken on a category's task.
 */
enum class DecisionAction {
    Prioritize,
    Maintain,
    Downgrade,
    Defer,
    Skip
};

inline constexpr DecisionAction kAllDecisionActions[] = {
    DecisionAction::Prioritize,
    DecisionAction::Maintain,
    DecisionAction::Downgrade,
    DecisionAction::Defer,
    DecisionAction::Skip
};

inline std::string ActionToString(DecisionAction action) {
    switch (action) {
        case DecisionAction::Prioritize: return "PRIORITIZE";
        case DecisionAction::Maintain: return "MAINTAIN";
        case DecisionAction::Downgrade: return "DOWNGRADE";
        case DecisionAction::Defer: return "DEFER";
        case DecisionAction::Skip: return "SKIP";
    }
    return "MAINTAIN";
}

inline DecisionAction ActionFromString(const std::string& value) {
    for (auto action : kAllDecisionActions) {
        if (ActionToString(action) == value) return action;
    }
    throw std::invalid_argument("Unknown decision action: " + value);
}

/**
 * @struct DomainDecision
 * @brief The action chosen for one category.
 *
 * adjustedTask is set exactly when action is Downgrade.
 */
struct DomainDecision {
    HealthCategory category = HealthCategory::Fitness;
    DecisionAction action = DecisionAction::Maintain;
    PlannedTask originalTask;
    std::optional<PlannedTask> adjustedTask;
    std::string reasoning;
    double priorityScore = 0.0;
};

/**
 * @struct FutureImpact
 * @brief Forward-looking note attached to a decision. Never executed by the engine.
 */
struct FutureImpact {
    int daysAffected = 1;
    std::string adjustmentType;   ///< intensity_reduction, reschedule, sleep_extension, deload_week.
    std::string description;
};

/** @brief One (category, constraint) contribution to the priority matrix. */
struct PriorityAdjustment {
    HealthCategory category = HealthCategory::Recovery;
    std::string source;           ///< Constraint name, or "user_preference".
    double delta = 0.0;
};

/**
 * @struct TradeOffDecision
 * @brief Immutable result of one decision cycle, appended to history.
 */
struct TradeOffDecision {
    std::string id;
    std::chrono::system_clock::time_point timestamp{};
    StateSnapshot state;
    std::vector<ConstraintKind> activeConstraints;
    std::vector<PriorityAdjustment> priorityAdjustments;
    CategoryWeights priorities;                 ///< Final normalized distribution.
    std::vector<DomainDecision> decisions;      ///< In ranked order.
    std::vector<FutureImpact> futureImpacts;
    double confidenceScore = 0.0;
    std::string reasoningSummary;

    bool hasConstraint(ConstraintKind kind) const {
        for (auto k : activeConstraints) {
            if (k == kind) return true;
        }
        return false;
    }

    /** @brief Decision for a category, or nullptr when no task was planned for it. */
    const DomainDecision* decisionFor(HealthCategory category) const {
        for (const auto& d : decisions) {
            if (d.category == category) return &d;
        }
        return nullptr;
    }

    bool hasAction(DecisionAction action) const {
        for (const auto& d : decisions) {
            if (d.action == action) return true;
        }
        return false;
    }
};

} // namespace equilibra::domain
